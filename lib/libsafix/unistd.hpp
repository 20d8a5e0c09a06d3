#ifndef LIBSAFIX_UNISTD_HEADER
#define LIBSAFIX_UNISTD_HEADER

#include "fcntl.hpp"
#include "file_desc.hpp"

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

/** \file
 * \brief Wrappers for the functions from unistd.h: working directory, links,
 * permissions, pipes, process identity and a few system queries.
 */

namespace sfx {

/// Working directory

result SFX_PUBLIC_SYMBOL chdir(path_arg path);
result SFX_PUBLIC_SYMBOL fchdir(int fd);

/// Gets the working directory. Works for paths of any length.
result SFX_PUBLIC_SYMBOL getcwd(std::string& out);

result SFX_PUBLIC_SYMBOL chroot(path_arg path);

/// Directories, links and file removal

result SFX_PUBLIC_SYMBOL mkdir(path_arg path, mode_t mode = 0777);
result SFX_PUBLIC_SYMBOL mkdirat(int dirfd, path_arg path, mode_t mode = 0777);
result SFX_PUBLIC_SYMBOL rmdir(path_arg path);
result SFX_PUBLIC_SYMBOL unlink(path_arg path);

/// Removes a file, or a directory if flags contains at_flag::removedir
result SFX_PUBLIC_SYMBOL unlinkat(int dirfd, path_arg path, at_flag flags = at_flag::none);

result SFX_PUBLIC_SYMBOL rename(path_arg from, path_arg to);
result SFX_PUBLIC_SYMBOL renameat(int from_dirfd, path_arg from, int to_dirfd, path_arg to);
result SFX_PUBLIC_SYMBOL link(path_arg target, path_arg path);
result SFX_PUBLIC_SYMBOL symlink(path_arg target, path_arg path);

/// Reads the target of a symlink. Works for targets of any length.
result SFX_PUBLIC_SYMBOL readlink(path_arg path, std::string& out);

/// Permissions and ownership

/// The mode argument of \ref access
enum class access_mode : int
{
	exists = F_OK,
	read = R_OK,
	write = W_OK,
	execute = X_OK
};
SFX_ENUM_FLAG_OPERATORS(access_mode)

result SFX_PUBLIC_SYMBOL access(path_arg path, access_mode mode);
result SFX_PUBLIC_SYMBOL faccessat(int dirfd, path_arg path, access_mode mode, at_flag flags = at_flag::none);

result SFX_PUBLIC_SYMBOL chmod(path_arg path, mode_t mode);
result SFX_PUBLIC_SYMBOL fchmod(int fd, mode_t mode);

/// nullopt leaves the owner or group unchanged
result SFX_PUBLIC_SYMBOL chown(path_arg path, std::optional<uid_t> owner, std::optional<gid_t> group);
result SFX_PUBLIC_SYMBOL lchown(path_arg path, std::optional<uid_t> owner, std::optional<gid_t> group);
result SFX_PUBLIC_SYMBOL fchown(int fd, std::optional<uid_t> owner, std::optional<gid_t> group);

result SFX_PUBLIC_SYMBOL truncate(path_arg path, off_t size);

/// Descriptors

/** \brief Creates a pipe.
 *
 * Neither end has FD_CLOEXEC set, prefer \ref pipe_cloexec.
 */
result SFX_PUBLIC_SYMBOL pipe(file_desc& read_end, file_desc& write_end);

/// Creates a pipe with FD_CLOEXEC set on both ends
result SFX_PUBLIC_SYMBOL pipe_cloexec(file_desc& read_end, file_desc& write_end);

/** \brief Makes newfd a copy of oldfd, closing newfd first if needed.
 *
 * The result does not take ownership of newfd, usually it is one of the standard descriptors.
 */
result SFX_PUBLIC_SYMBOL dup2(int oldfd, int newfd);

/** \brief Like \ref dup2, with flags applied to newfd.
 *
 * The only accepted flag is oflag::cloexec. Unlike dup2, oldfd equal to newfd
 * fails with EINVAL. Where the C library lacks dup3, the flag is set after the
 * copy while the fork lock is held, so no concurrent spawn sees newfd without it.
 */
result SFX_PUBLIC_SYMBOL dup3(int oldfd, int newfd, oflag flags);

/// Closes a raw descriptor
result SFX_PUBLIC_SYMBOL close(int fd);

/// Sets is_tty. Not being a terminal is not an error, other failures such as EBADF are.
result SFX_PUBLIC_SYMBOL isatty(int fd, bool& is_tty);

/// Process identity

pid_t SFX_PUBLIC_SYMBOL getpid();
pid_t SFX_PUBLIC_SYMBOL getppid();
uid_t SFX_PUBLIC_SYMBOL getuid();
uid_t SFX_PUBLIC_SYMBOL geteuid();
gid_t SFX_PUBLIC_SYMBOL getgid();
gid_t SFX_PUBLIC_SYMBOL getegid();

/// Pass 0 for the calling process
result SFX_PUBLIC_SYMBOL getpgid(pid_t pid, pid_t& out);
result SFX_PUBLIC_SYMBOL getsid(pid_t pid, pid_t& out);
result SFX_PUBLIC_SYMBOL setpgid(pid_t pid, pid_t pgid);
result SFX_PUBLIC_SYMBOL setsid(pid_t& sid);

/// Gets the supplementary group IDs of the calling process
result SFX_PUBLIC_SYMBOL getgroups(std::vector<gid_t>& out);

/// Real, effective and saved IDs. Fails with ENOSYS where unsupported.
result SFX_PUBLIC_SYMBOL getresuid(uid_t& ruid, uid_t& euid, uid_t& suid);
result SFX_PUBLIC_SYMBOL getresgid(gid_t& rgid, gid_t& egid, gid_t& sgid);

/// Strings

result SFX_PUBLIC_SYMBOL gethostname(std::string& out);

/// Gets the path of the terminal device open on fd
result SFX_PUBLIC_SYMBOL ttyname(int fd, std::string& out);

/// Gets the name of the user logged in on the controlling terminal
result SFX_PUBLIC_SYMBOL getlogin(std::string& out);

/// System

/// Commits all filesystem caches to disk
void SFX_PUBLIC_SYMBOL sync();

result SFX_PUBLIC_SYMBOL fsync(int fd);

/** \brief Gets a configurable system variable.
 *
 * If the variable has no limit, \c value is set to -1 and success returned.
 */
result SFX_PUBLIC_SYMBOL sysconf(int name, long& value);

/// Like \ref sysconf, for a configurable limit of the filesystem containing path
result SFX_PUBLIC_SYMBOL pathconf(path_arg path, int name, long& value);

long SFX_PUBLIC_SYMBOL getpagesize();

}

#endif
