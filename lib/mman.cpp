#include "syscall.hpp"
#include "libsafix/mman.hpp"

namespace sfx {

result mlock(void const* addr, size_t len)
{
	return check(::mlock(addr, len));
}

result munlock(void const* addr, size_t len)
{
	return check(::munlock(addr, len));
}

result mlockall(mlockall_flag flags)
{
	return check(::mlockall(static_cast<int>(flags)));
}

result munlockall()
{
	return check(::munlockall());
}

result msync(void* addr, size_t len, msync_flag flags)
{
	return check(::msync(addr, len, static_cast<int>(flags)));
}

result posix_madvise(void* addr, size_t len, madvice advice)
{
	// Returns the error number instead of setting errno
	return check_code(::posix_madvise(addr, len, static_cast<int>(advice)));
}

result memfd_create([[maybe_unused]] file_desc& out, [[maybe_unused]] path_arg name, [[maybe_unused]] memfd_flag flags)
{
#if HAVE_MEMFD_CREATE
	return name.with_cstr([&](cstring_view n) {
		int fd = ::memfd_create(n.c_str(), static_cast<unsigned int>(flags));
		if (fd == -1) {
			return result_from_errno(errno);
		}
		out.reset(fd);
		return result{result::ok};
	});
#else
	return {result::other, ENOSYS};
#endif
}

}
