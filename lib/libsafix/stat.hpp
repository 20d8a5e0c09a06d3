#ifndef LIBSAFIX_STAT_HEADER
#define LIBSAFIX_STAT_HEADER

#include "fcntl.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

/** \file
 * \brief File status: stat, lstat, fstat, fstatat and umask
 */

namespace sfx {

/// The file type bits (S_IFMT) of a file mode
enum class file_type
{
	unknown,
	fifo,
	character,
	directory,
	block,
	regular,
	symlink,
	socket
};

/// Extracts the file type from a st_mode value
file_type SFX_PUBLIC_SYMBOL mode_to_file_type(mode_t mode);

/// The S_IFMT bits for a file type, 0 for unknown
mode_t SFX_PUBLIC_SYMBOL file_type_to_mode(file_type t);

/** \brief The status of a file, a thin wrapper around struct stat
 */
class SFX_PUBLIC_SYMBOL stat_info final
{
public:
	stat_info() = default;
	explicit stat_info(struct stat const& st)
		: st_(st)
	{}

	dev_t dev() const { return st_.st_dev; }
	ino_t ino() const { return st_.st_ino; }

	/// The full mode, including file type and permission bits
	mode_t mode() const { return st_.st_mode; }
	file_type type() const { return mode_to_file_type(st_.st_mode); }

	bool is_dir() const { return type() == file_type::directory; }
	bool is_regular() const { return type() == file_type::regular; }
	bool is_symlink() const { return type() == file_type::symlink; }

	bool is_suid() const { return (st_.st_mode & S_ISUID) != 0; }
	bool is_sgid() const { return (st_.st_mode & S_ISGID) != 0; }
	bool is_sticky() const { return (st_.st_mode & S_ISVTX) != 0; }

	/// Permission bits including setuid, setgid and sticky bit
	mode_t access_mode() const { return st_.st_mode & 07777; }

	nlink_t nlink() const { return st_.st_nlink; }
	uid_t uid() const { return st_.st_uid; }
	gid_t gid() const { return st_.st_gid; }
	dev_t rdev() const { return st_.st_rdev; }
	off_t size() const { return st_.st_size; }
	blksize_t blksize() const { return st_.st_blksize; }
	blkcnt_t blocks() const { return st_.st_blocks; }

	timespec atime() const;
	timespec mtime() const;
	timespec ctime() const;

	struct stat const& native() const { return st_; }
	struct stat& native() { return st_; }

private:
	struct stat st_{};
};

/// Gets the status of the file at path, following symlinks
result SFX_PUBLIC_SYMBOL stat(path_arg path, stat_info& out);

/// Gets the status of the file at path. If it is a symlink, gets the status of the link itself
result SFX_PUBLIC_SYMBOL lstat(path_arg path, stat_info& out);

result SFX_PUBLIC_SYMBOL fstat(int fd, stat_info& out);

/// Relative paths are resolved against dirfd, pass at_flag::symlink_nofollow to behave like lstat.
result SFX_PUBLIC_SYMBOL fstatat(int dirfd, path_arg path, stat_info& out, at_flag flags = at_flag::none);

/// Sets the file creation mask, returns the previous mask. Cannot fail.
mode_t SFX_PUBLIC_SYMBOL umask(mode_t mask);

}

#endif
