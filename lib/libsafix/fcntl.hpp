#ifndef LIBSAFIX_FCNTL_HEADER
#define LIBSAFIX_FCNTL_HEADER

#include "error.hpp"
#include "path.hpp"

#include <fcntl.h>
#include <sys/types.h>

/** \file
 * \brief Opening files and manipulating descriptor flags: open, openat, fcntl
 */

namespace sfx {

class file_desc;

/// Flags for \ref open and \ref openat, mirroring the O_* constants
enum class oflag : int
{
	read_only = O_RDONLY,
	write_only = O_WRONLY,
	read_write = O_RDWR,

	/// Create the file if it does not exist
	create = O_CREAT,

	/// Together with \c create, fail with EEXIST if the file exists
	exclusive = O_EXCL,

	truncate = O_TRUNC,
	append = O_APPEND,
	nonblock = O_NONBLOCK,
	cloexec = O_CLOEXEC,

	/// Fail with ENOTDIR unless the path names a directory
	directory = O_DIRECTORY,

	/// Fail with ELOOP if the last path component is a symlink
	nofollow = O_NOFOLLOW,

	sync = O_SYNC,
	noctty = O_NOCTTY
};
SFX_ENUM_FLAG_OPERATORS(oflag)

/// Flags for the *at family of functions, mirroring the AT_* constants
enum class at_flag : int
{
	none = 0,
	symlink_nofollow = AT_SYMLINK_NOFOLLOW,
	symlink_follow = AT_SYMLINK_FOLLOW,
	removedir = AT_REMOVEDIR,
	eaccess = AT_EACCESS,

#ifdef AT_EMPTY_PATH
	/// With an empty path, operate on dirfd itself
	empty_path = AT_EMPTY_PATH,
#endif
};
SFX_ENUM_FLAG_OPERATORS(at_flag)

/// Passed as directory descriptor to the *at functions to resolve relative to the working directory
constexpr int at_fdcwd = AT_FDCWD;

/** \brief Opens a file.
 *
 * On success \c fd owns the new descriptor, any descriptor it held before is closed.
 * On failure \c fd is left unchanged.
 *
 * \c mode is only used when creating the file and is subject to the umask.
 */
result SFX_PUBLIC_SYMBOL open(file_desc& fd, path_arg path, oflag flags, mode_t mode = 0666);

/// Like \ref open, relative paths are resolved against \c dirfd.
result SFX_PUBLIC_SYMBOL openat(file_desc& fd, int dirfd, path_arg path, oflag flags, mode_t mode = 0666);

/// Gets the descriptor flags (FD_CLOEXEC)
result SFX_PUBLIC_SYMBOL fcntl_getfd(int fd, int& flags);
result SFX_PUBLIC_SYMBOL fcntl_setfd(int fd, int flags);

/// Gets the file status flags (O_APPEND, O_NONBLOCK, ...) and access mode
result SFX_PUBLIC_SYMBOL fcntl_getfl(int fd, int& flags);
result SFX_PUBLIC_SYMBOL fcntl_setfl(int fd, int flags);

/// Duplicates \c fd to the lowest free descriptor not below \c min, with FD_CLOEXEC set
result SFX_PUBLIC_SYMBOL dupfd_cloexec(int fd, int min, file_desc& out);

/** \brief Creates and opens a unique temporary file.
 *
 * \c templ must end in "XXXXXX", which gets replaced with the chosen name.
 * The file is opened with FD_CLOEXEC set.
 */
result SFX_PUBLIC_SYMBOL mkstemp(std::string& templ, file_desc& fd);

}

#endif
