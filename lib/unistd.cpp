#include "syscall.hpp"
#include "libsafix/glue/unix.hpp"
#include "libsafix/unistd.hpp"

#include <limits.h>
#include <string.h>

namespace sfx {

namespace {
// Calls f(buf, size) with growing buffers as long as it fails with ERANGE.
// f returns 0 on success or an errno value. The result is NUL-terminated.
template<typename F>
result fill_string(std::string& out, size_t size, F && f)
{
	std::vector<char> buf;
	while (true) {
		buf.resize(size);
		int err = f(buf.data(), buf.size());
		if (!err) {
			break;
		}
		if (err != ERANGE || size >= (1u << 20)) {
			return result_from_errno(err);
		}
		size *= 2;
	}

	out.assign(buf.data(), strnlen(buf.data(), buf.size()));
	return {result::ok};
}

uid_t to_raw_uid(std::optional<uid_t> const& id)
{
	return id ? *id : static_cast<uid_t>(-1);
}

gid_t to_raw_gid(std::optional<gid_t> const& id)
{
	return id ? *id : static_cast<gid_t>(-1);
}
}

result chdir(path_arg path)
{
	return path.with_cstr([](cstring_view p) {
		return check(::chdir(p.c_str()));
	});
}

result fchdir(int fd)
{
	return check(::fchdir(fd));
}

result getcwd(std::string& out)
{
	return fill_string(out, PATH_MAX, [](char* buf, size_t size) {
		return ::getcwd(buf, size) ? 0 : errno;
	});
}

result chroot(path_arg path)
{
	return path.with_cstr([](cstring_view p) {
		return check(::chroot(p.c_str()));
	});
}

result mkdir(path_arg path, mode_t mode)
{
	return path.with_cstr([mode](cstring_view p) {
		return check(::mkdir(p.c_str(), mode));
	});
}

result mkdirat(int dirfd, path_arg path, mode_t mode)
{
	return path.with_cstr([dirfd, mode](cstring_view p) {
		return check(::mkdirat(dirfd, p.c_str(), mode));
	});
}

result rmdir(path_arg path)
{
	return path.with_cstr([](cstring_view p) {
		return check(::rmdir(p.c_str()));
	});
}

result unlink(path_arg path)
{
	return path.with_cstr([](cstring_view p) {
		return check(::unlink(p.c_str()));
	});
}

result unlinkat(int dirfd, path_arg path, at_flag flags)
{
	return path.with_cstr([dirfd, flags](cstring_view p) {
		return check(::unlinkat(dirfd, p.c_str(), static_cast<int>(flags)));
	});
}

result rename(path_arg from, path_arg to)
{
	return renameat(at_fdcwd, from, at_fdcwd, to);
}

result renameat(int from_dirfd, path_arg from, int to_dirfd, path_arg to)
{
	return from.with_cstr([&](cstring_view f) {
		return to.with_cstr([&](cstring_view t) {
			return check(::renameat(from_dirfd, f.c_str(), to_dirfd, t.c_str()));
		});
	});
}

result link(path_arg target, path_arg path)
{
	return target.with_cstr([&](cstring_view t) {
		return path.with_cstr([&](cstring_view p) {
			return check(::link(t.c_str(), p.c_str()));
		});
	});
}

result symlink(path_arg target, path_arg path)
{
	return target.with_cstr([&](cstring_view t) {
		return path.with_cstr([&](cstring_view p) {
			return check(::symlink(t.c_str(), p.c_str()));
		});
	});
}

result readlink(path_arg path, std::string& out)
{
	return path.with_cstr([&](cstring_view p) -> result {
		// readlink silently truncates, a result filling the whole buffer may be incomplete
		std::vector<char> buf(256);
		while (true) {
			ssize_t len = ::readlink(p.c_str(), buf.data(), buf.size());
			if (len == -1) {
				return result_from_errno(errno);
			}
			if (static_cast<size_t>(len) < buf.size()) {
				out.assign(buf.data(), static_cast<size_t>(len));
				return {result::ok};
			}
			if (buf.size() >= (1u << 20)) {
				return {result::invalid, ENAMETOOLONG};
			}
			buf.resize(buf.size() * 2);
		}
	});
}

result access(path_arg path, access_mode mode)
{
	return path.with_cstr([mode](cstring_view p) {
		return check(::access(p.c_str(), static_cast<int>(mode)));
	});
}

result faccessat(int dirfd, path_arg path, access_mode mode, at_flag flags)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::faccessat(dirfd, p.c_str(), static_cast<int>(mode), static_cast<int>(flags)));
	});
}

result chmod(path_arg path, mode_t mode)
{
	return path.with_cstr([mode](cstring_view p) {
		return check(::chmod(p.c_str(), mode));
	});
}

result fchmod(int fd, mode_t mode)
{
	return check(::fchmod(fd, mode));
}

result chown(path_arg path, std::optional<uid_t> owner, std::optional<gid_t> group)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::chown(p.c_str(), to_raw_uid(owner), to_raw_gid(group)));
	});
}

result lchown(path_arg path, std::optional<uid_t> owner, std::optional<gid_t> group)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::lchown(p.c_str(), to_raw_uid(owner), to_raw_gid(group)));
	});
}

result fchown(int fd, std::optional<uid_t> owner, std::optional<gid_t> group)
{
	return check(::fchown(fd, to_raw_uid(owner), to_raw_gid(group)));
}

result truncate(path_arg path, off_t size)
{
	return path.with_cstr([size](cstring_view p) {
		return check(::truncate(p.c_str(), size));
	});
}

result pipe(file_desc& read_end, file_desc& write_end)
{
	int fds[2];
	if (::pipe(fds) != 0) {
		return result_from_errno(errno);
	}

	read_end.reset(fds[0]);
	write_end.reset(fds[1]);
	return {result::ok};
}

result pipe_cloexec(file_desc& read_end, file_desc& write_end)
{
	int fds[2];
	int err = create_pipe(fds);
	if (err) {
		return result_from_errno(err);
	}

	read_end.reset(fds[0]);
	write_end.reset(fds[1]);
	return {result::ok};
}

result dup2(int oldfd, int newfd)
{
	return check(::dup2(oldfd, newfd));
}

result dup3(int oldfd, int newfd, oflag flags)
{
	int const raw = static_cast<int>(flags);
	if ((raw & ~O_CLOEXEC) || oldfd == newfd) {
		return invalid_argument<result>();
	}

#if HAVE_DUP3
	return check(::dup3(oldfd, newfd, raw));
#else
	forkblock b;
	if (::dup2(oldfd, newfd) == -1) {
		return result_from_errno(errno);
	}
	if (raw & O_CLOEXEC) {
		return result_from_errno(set_cloexec(newfd));
	}
	return {result::ok};
#endif
}

result close(int fd)
{
	return check(::close(fd));
}

result isatty(int fd, bool& is_tty)
{
	if (::isatty(fd) == 1) {
		is_tty = true;
		return {result::ok};
	}

	int const err = errno;
	if (err == ENOTTY || err == EINVAL) {
		is_tty = false;
		return {result::ok};
	}
	return result_from_errno(err);
}

pid_t getpid()
{
	return ::getpid();
}

pid_t getppid()
{
	return ::getppid();
}

uid_t getuid()
{
	return ::getuid();
}

uid_t geteuid()
{
	return ::geteuid();
}

gid_t getgid()
{
	return ::getgid();
}

gid_t getegid()
{
	return ::getegid();
}

result getpgid(pid_t pid, pid_t& out)
{
	pid_t ret = ::getpgid(pid);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	out = ret;
	return {result::ok};
}

result getsid(pid_t pid, pid_t& out)
{
	pid_t ret = ::getsid(pid);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	out = ret;
	return {result::ok};
}

result setpgid(pid_t pid, pid_t pgid)
{
	return check(::setpgid(pid, pgid));
}

result setsid(pid_t& sid)
{
	pid_t ret = ::setsid();
	if (ret == -1) {
		return result_from_errno(errno);
	}
	sid = ret;
	return {result::ok};
}

result getgroups(std::vector<gid_t>& out)
{
	// The group list may change between the two calls
	while (true) {
		int n = ::getgroups(0, nullptr);
		if (n == -1) {
			return result_from_errno(errno);
		}

		out.resize(static_cast<size_t>(n));
		if (!n) {
			return {result::ok};
		}

		int ret = ::getgroups(n, out.data());
		if (ret != -1) {
			out.resize(static_cast<size_t>(ret));
			return {result::ok};
		}
		if (errno != EINVAL) {
			return result_from_errno(errno);
		}
	}
}

result getresuid([[maybe_unused]] uid_t& ruid, [[maybe_unused]] uid_t& euid, [[maybe_unused]] uid_t& suid)
{
#if HAVE_GETRESUID
	return check(::getresuid(&ruid, &euid, &suid));
#else
	return {result::other, ENOSYS};
#endif
}

result getresgid([[maybe_unused]] gid_t& rgid, [[maybe_unused]] gid_t& egid, [[maybe_unused]] gid_t& sgid)
{
#if HAVE_GETRESUID
	return check(::getresgid(&rgid, &egid, &sgid));
#else
	return {result::other, ENOSYS};
#endif
}

result gethostname(std::string& out)
{
	long max = ::sysconf(_SC_HOST_NAME_MAX);
	size_t size = (max > 0) ? static_cast<size_t>(max) + 1 : 256;

	return fill_string(out, size, [](char* buf, size_t size) {
		if (::gethostname(buf, size) != 0) {
			// Truncation is reported differently across systems
			return (errno == ENAMETOOLONG || errno == EINVAL) ? ERANGE : errno;
		}
		if (!memchr(buf, 0, size)) {
			return ERANGE;
		}
		return 0;
	});
}

result ttyname(int fd, std::string& out)
{
	return fill_string(out, 64, [fd](char* buf, size_t size) {
		return ::ttyname_r(fd, buf, size);
	});
}

result getlogin(std::string& out)
{
	long max = ::sysconf(_SC_LOGIN_NAME_MAX);
	size_t size = (max > 0) ? static_cast<size_t>(max) + 1 : 256;

	return fill_string(out, size, [](char* buf, size_t size) {
		return ::getlogin_r(buf, size);
	});
}

void sync()
{
	::sync();
}

result fsync(int fd)
{
	return check(::fsync(fd));
}

result sysconf(int name, long& value)
{
	// -1 without errno change means no limit
	errno = 0;
	long ret = ::sysconf(name);
	if (ret == -1 && errno) {
		return result_from_errno(errno);
	}
	value = ret;
	return {result::ok};
}

result pathconf(path_arg path, int name, long& value)
{
	return path.with_cstr([&](cstring_view p) -> result {
		errno = 0;
		long ret = ::pathconf(p.c_str(), name);
		if (ret == -1 && errno) {
			return result_from_errno(errno);
		}
		value = ret;
		return {result::ok};
	});
}

long getpagesize()
{
	return ::sysconf(_SC_PAGESIZE);
}

}
