#include "syscall.hpp"
#include "libsafix/fcntl.hpp"
#include "libsafix/file_desc.hpp"
#include "libsafix/glue/unix.hpp"

#include <stdlib.h>
#include <unistd.h>

namespace sfx {

result open(file_desc& fd, path_arg path, oflag flags, mode_t mode)
{
	return openat(fd, at_fdcwd, path, flags, mode);
}

result openat(file_desc& fd, int dirfd, path_arg path, oflag flags, mode_t mode)
{
	return path.with_cstr([&](cstring_view p) -> result {
		int ret = ::openat(dirfd, p.c_str(), static_cast<int>(flags), mode);
		if (ret == -1) {
			return result_from_errno(errno);
		}

		fd.reset(ret);
		return {result::ok};
	});
}

result fcntl_getfd(int fd, int& flags)
{
	int ret = ::fcntl(fd, F_GETFD);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	flags = ret;
	return {result::ok};
}

result fcntl_setfd(int fd, int flags)
{
	return check(::fcntl(fd, F_SETFD, flags));
}

result fcntl_getfl(int fd, int& flags)
{
	int ret = ::fcntl(fd, F_GETFL);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	flags = ret;
	return {result::ok};
}

result fcntl_setfl(int fd, int flags)
{
	return check(::fcntl(fd, F_SETFL, flags));
}

result dupfd_cloexec(int fd, int min, file_desc& out)
{
	int ret = ::fcntl(fd, F_DUPFD_CLOEXEC, min);
	if (ret == -1) {
		return result_from_errno(errno);
	}

	out.reset(ret);
	return {result::ok};
}

result mkstemp(std::string& templ, file_desc& fd)
{
	if (templ.find('\0') != std::string::npos) {
		return {result::invalid, EINVAL};
	}

#if HAVE_MKOSTEMP
	int ret = ::mkostemp(templ.data(), O_CLOEXEC);
	if (ret == -1) {
		return result_from_errno(errno);
	}
#else
	forkblock b;
	int ret = ::mkstemp(templ.data());
	if (ret == -1) {
		return result_from_errno(errno);
	}
	int const err = set_cloexec(ret);
	if (err) {
		::close(ret);
		::unlink(templ.c_str());
		return result_from_errno(err);
	}
#endif

	fd.reset(ret);
	return {result::ok};
}

}
