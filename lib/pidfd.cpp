#include "syscall.hpp"
#include "libsafix/pidfd.hpp"

#if SFX_LINUX
#include <sys/syscall.h>
#endif

namespace sfx {

namespace {
#if SFX_LINUX && defined(SYS_pidfd_open)
result adopt(long ret, file_desc& out)
{
	if (ret == -1) {
		return result_from_errno(errno);
	}
	out.reset(static_cast<int>(ret));
	return {result::ok};
}
#endif
}

result pidfd_open([[maybe_unused]] file_desc& out, [[maybe_unused]] pid_t pid, [[maybe_unused]] unsigned int flags)
{
#if SFX_LINUX && defined(SYS_pidfd_open)
	return adopt(::syscall(SYS_pidfd_open, pid, flags), out);
#else
	return {result::other, ENOSYS};
#endif
}

result pidfd_getfd([[maybe_unused]] file_desc& out, [[maybe_unused]] int pidfd, [[maybe_unused]] int targetfd, [[maybe_unused]] unsigned int flags)
{
#if SFX_LINUX && defined(SYS_pidfd_getfd)
	return adopt(::syscall(SYS_pidfd_getfd, pidfd, targetfd, flags), out);
#else
	return {result::other, ENOSYS};
#endif
}

result pidfd_send_signal([[maybe_unused]] int pidfd, [[maybe_unused]] int sig, [[maybe_unused]] unsigned int flags)
{
#if SFX_LINUX && defined(SYS_pidfd_send_signal)
	return check(static_cast<int>(::syscall(SYS_pidfd_send_signal, pidfd, sig, nullptr, flags)));
#else
	return {result::other, ENOSYS};
#endif
}

}
