#ifndef LIBSAFIX_SYSCALL_HEADER
#define LIBSAFIX_SYSCALL_HEADER

// Internal helpers shared by the wrapper implementations. Not installed.

#include "config.hpp"
#include "libsafix/error.hpp"
#include "libsafix/mutex.hpp"

#include <errno.h>
#include <sys/types.h>
#include <unistd.h>

namespace sfx {

// Held while spawning. Unlike forkblock it does not make a forked child exit.
SFX_PRIVATE_SYMBOL mutex& forkblock_mutex();

// For calls that fail only on misuse or resource exhaustion and return the
// error number directly, such as the pthread and posix_spawn init functions.
// Prints op and the error to stderr and aborts if ret is non-zero.
SFX_PRIVATE_SYMBOL void check_or_abort(char const* op, int ret);

// Calls returning -1 and setting errno
inline result check(int ret)
{
	if (ret == -1) {
		return result_from_errno(errno);
	}
	return {result::ok};
}

// Calls returning the error number directly, 0 on success
inline result check_code(int ret)
{
	if (ret != 0) {
		return result_from_errno(ret);
	}
	return {result::ok};
}

// Transfer calls returning a byte count or -1
inline rwresult check_size(ssize_t ret)
{
	if (ret == -1) {
		return rwresult_from_errno(errno);
	}
	return rwresult{static_cast<size_t>(ret)};
}

// Starting size for the buffers of the reentrant database lookups
inline size_t lookup_buffer_size(int sc_name)
{
	long s = ::sysconf(sc_name);
	if (s <= 0) {
		return 1024;
	}
	return static_cast<size_t>(s);
}

// Upper bound when growing those buffers on ERANGE
constexpr size_t max_lookup_buffer_size = 1024 * 1024;

// Lookup failures that just mean the entry does not exist
inline bool is_not_found(int err)
{
	return !err || err == ENOENT || err == ESRCH || err == EBADF || err == EPERM;
}

}

#endif
