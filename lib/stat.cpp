#include "syscall.hpp"
#include "libsafix/stat.hpp"

namespace sfx {

file_type mode_to_file_type(mode_t mode)
{
	switch (mode & S_IFMT) {
	case S_IFIFO:
		return file_type::fifo;
	case S_IFCHR:
		return file_type::character;
	case S_IFDIR:
		return file_type::directory;
	case S_IFBLK:
		return file_type::block;
	case S_IFREG:
		return file_type::regular;
	case S_IFLNK:
		return file_type::symlink;
	case S_IFSOCK:
		return file_type::socket;
	default:
		return file_type::unknown;
	}
}

mode_t file_type_to_mode(file_type t)
{
	switch (t) {
	case file_type::fifo:
		return S_IFIFO;
	case file_type::character:
		return S_IFCHR;
	case file_type::directory:
		return S_IFDIR;
	case file_type::block:
		return S_IFBLK;
	case file_type::regular:
		return S_IFREG;
	case file_type::symlink:
		return S_IFLNK;
	case file_type::socket:
		return S_IFSOCK;
	default:
		return 0;
	}
}

#if SFX_MAC
timespec stat_info::atime() const { return st_.st_atimespec; }
timespec stat_info::mtime() const { return st_.st_mtimespec; }
timespec stat_info::ctime() const { return st_.st_ctimespec; }
#else
timespec stat_info::atime() const { return st_.st_atim; }
timespec stat_info::mtime() const { return st_.st_mtim; }
timespec stat_info::ctime() const { return st_.st_ctim; }
#endif

result stat(path_arg path, stat_info& out)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::stat(p.c_str(), &out.native()));
	});
}

result lstat(path_arg path, stat_info& out)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::lstat(p.c_str(), &out.native()));
	});
}

result fstat(int fd, stat_info& out)
{
	return check(::fstat(fd, &out.native()));
}

result fstatat(int dirfd, path_arg path, stat_info& out, at_flag flags)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::fstatat(dirfd, p.c_str(), &out.native(), static_cast<int>(flags)));
	});
}

mode_t umask(mode_t mask)
{
	return ::umask(mask);
}

}
