#include "syscall.hpp"
#include "libsafix/eventfd.hpp"

#if SFX_LINUX
#include <sys/eventfd.h>
#endif

namespace sfx {

#if SFX_LINUX
static_assert(static_cast<int>(eventfd_flag::semaphore) == EFD_SEMAPHORE, "EFD_SEMAPHORE mismatch");
static_assert(static_cast<int>(eventfd_flag::nonblock) == EFD_NONBLOCK, "EFD_NONBLOCK mismatch");
static_assert(static_cast<int>(eventfd_flag::cloexec) == EFD_CLOEXEC, "EFD_CLOEXEC mismatch");
#endif

result eventfd([[maybe_unused]] file_desc& out, [[maybe_unused]] unsigned int initval, [[maybe_unused]] eventfd_flag flags)
{
#if SFX_LINUX
	int fd = ::eventfd(initval, static_cast<int>(flags));
	if (fd == -1) {
		return result_from_errno(errno);
	}
	out.reset(fd);
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

result eventfd_read([[maybe_unused]] int fd, [[maybe_unused]] uint64_t& value)
{
#if SFX_LINUX
	uint64_t buf{};
	ssize_t ret = ::read(fd, &buf, sizeof(buf));
	if (ret == -1) {
		return result_from_errno(errno);
	}
	if (ret != static_cast<ssize_t>(sizeof(buf))) {
		return invalid_argument<result>();
	}
	value = buf;
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

result eventfd_write([[maybe_unused]] int fd, [[maybe_unused]] uint64_t value)
{
#if SFX_LINUX
	ssize_t ret = ::write(fd, &value, sizeof(value));
	if (ret == -1) {
		return result_from_errno(errno);
	}
	if (ret != static_cast<ssize_t>(sizeof(value))) {
		return invalid_argument<result>();
	}
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

}
