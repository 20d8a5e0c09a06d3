#ifndef LIBSAFIX_SPAWN_HEADER
#define LIBSAFIX_SPAWN_HEADER

#include "cstring_vec.hpp"
#include "fcntl.hpp"
#include "signal.hpp"

#include <optional>

#include <spawn.h>
#include <sys/types.h>

/** \file
 * \brief Starting processes with posix_spawn and reaping them
 *
 * Example:
 * \code
 * sfx::cstring_vec argv{"ls", "-l"};
 * pid_t pid{};
 * if (sfx::spawnp(pid, "ls", nullptr, nullptr, argv)) {
 *     int status{};
 *     sfx::wait_pid(pid, status);
 * }
 * \endcode
 */

namespace sfx {

/** \brief The list of actions performed in the child before the new program is executed
 *
 * Actions are run in the order they were added.
 */
class SFX_PUBLIC_SYMBOL spawn_file_actions final
{
public:
	/// Aborts if the C library cannot initialize the list, which only happens when out of memory
	spawn_file_actions();
	~spawn_file_actions();

	spawn_file_actions(spawn_file_actions const&) = delete;
	spawn_file_actions& operator=(spawn_file_actions const&) = delete;

	/// Opens path as descriptor fd in the child
	result add_open(int fd, path_arg path, oflag flags, mode_t mode = 0666);

	result add_close(int fd);

	/// Makes newfd a copy of fd in the child. Unlike the descriptor fd, newfd does not have FD_CLOEXEC set.
	result add_dup2(int fd, int newfd);

	posix_spawn_file_actions_t const* native() const { return &actions_; }

private:
	posix_spawn_file_actions_t actions_;
};

/// Flags for \ref spawn_attr::set_flags
enum class spawn_flag : short
{
	none = 0,

	/// Reset the effective IDs to the real IDs
	resetids = POSIX_SPAWN_RESETIDS,

	/// Put the child into the process group set with \ref spawn_attr::set_pgroup
	setpgroup = POSIX_SPAWN_SETPGROUP,

	/// Reset the signals set with \ref spawn_attr::set_sigdefault to their default action
	setsigdef = POSIX_SPAWN_SETSIGDEF,

	/// Use the signal mask set with \ref spawn_attr::set_sigmask
	setsigmask = POSIX_SPAWN_SETSIGMASK,

#ifdef POSIX_SPAWN_SETSID
	/// Make the child a session leader
	setsid = POSIX_SPAWN_SETSID,
#endif
};
SFX_ENUM_FLAG_OPERATORS(spawn_flag)

/// Attributes of the process created by \ref spawn
class SFX_PUBLIC_SYMBOL spawn_attr final
{
public:
	/// Aborts if initialization fails, see \ref spawn_file_actions::spawn_file_actions
	spawn_attr();
	~spawn_attr();

	spawn_attr(spawn_attr const&) = delete;
	spawn_attr& operator=(spawn_attr const&) = delete;

	result set_flags(spawn_flag flags);
	result get_flags(spawn_flag& flags) const;

	result set_pgroup(pid_t pgroup);
	result get_pgroup(pid_t& pgroup) const;

	result set_sigmask(sig_set const& mask);
	result get_sigmask(sig_set& mask) const;

	result set_sigdefault(sig_set const& signals);
	result get_sigdefault(sig_set& signals) const;

	posix_spawnattr_t const* native() const { return &attr_; }

private:
	posix_spawnattr_t attr_;
};

/** \brief Starts a new process executing the program at path.
 *
 * \param pid Receives the process ID of the child on success.
 * \param actions May be null.
 * \param attr May be null.
 * \param argv The arguments, by convention starting with the program name.
 * \param envp The environment of the new process.
 *
 * Does not start while a \ref forkblock is held. Errors in the child before the
 * program is executed, e.g. a missing program, are reported either as failure here
 * or as exit status 127, depending on the C library.
 */
result SFX_PUBLIC_SYMBOL spawn(pid_t& pid, path_arg path, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv, cstring_vec const& envp);

/// \overload The child inherits the environment of the calling process.
result SFX_PUBLIC_SYMBOL spawn(pid_t& pid, path_arg path, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv);

/// Like \ref spawn, but a file name without slash is searched for in PATH.
result SFX_PUBLIC_SYMBOL spawnp(pid_t& pid, path_arg file, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv, cstring_vec const& envp);

/// \overload
result SFX_PUBLIC_SYMBOL spawnp(pid_t& pid, path_arg file, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv);

/** \brief Waits for a child to change state.
 *
 * Thin wrapper around waitpid, retries on EINTR. With WNOHANG in options and no
 * child ready to be reaped, success is returned and reaped is set to 0.
 */
result SFX_PUBLIC_SYMBOL wait_pid(pid_t pid, int& status, int options = 0, pid_t* reaped = nullptr);

/// The exit code if the child terminated normally
std::optional<int> SFX_PUBLIC_SYMBOL exit_status(int status);

/// The signal number if the child was killed by a signal
std::optional<int> SFX_PUBLIC_SYMBOL term_signal(int status);

}

#endif
