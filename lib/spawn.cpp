#include "syscall.hpp"
#include "libsafix/spawn.hpp"

#include <sys/wait.h>

extern char **environ;

namespace sfx {

spawn_file_actions::spawn_file_actions()
{
	check_or_abort("posix_spawn_file_actions_init", posix_spawn_file_actions_init(&actions_));
}

spawn_file_actions::~spawn_file_actions()
{
	posix_spawn_file_actions_destroy(&actions_);
}

result spawn_file_actions::add_open(int fd, path_arg path, oflag flags, mode_t mode)
{
	// The path is copied by posix_spawn_file_actions_addopen
	return path.with_cstr([&](cstring_view p) {
		return check_code(posix_spawn_file_actions_addopen(&actions_, fd, p.c_str(), static_cast<int>(flags), mode));
	});
}

result spawn_file_actions::add_close(int fd)
{
	return check_code(posix_spawn_file_actions_addclose(&actions_, fd));
}

result spawn_file_actions::add_dup2(int fd, int newfd)
{
	return check_code(posix_spawn_file_actions_adddup2(&actions_, fd, newfd));
}

spawn_attr::spawn_attr()
{
	check_or_abort("posix_spawnattr_init", posix_spawnattr_init(&attr_));
}

spawn_attr::~spawn_attr()
{
	posix_spawnattr_destroy(&attr_);
}

result spawn_attr::set_flags(spawn_flag flags)
{
	return check_code(posix_spawnattr_setflags(&attr_, static_cast<short>(flags)));
}

result spawn_attr::get_flags(spawn_flag& flags) const
{
	short f{};
	auto r = check_code(posix_spawnattr_getflags(&attr_, &f));
	if (r) {
		flags = static_cast<spawn_flag>(f);
	}
	return r;
}

result spawn_attr::set_pgroup(pid_t pgroup)
{
	return check_code(posix_spawnattr_setpgroup(&attr_, pgroup));
}

result spawn_attr::get_pgroup(pid_t& pgroup) const
{
	return check_code(posix_spawnattr_getpgroup(&attr_, &pgroup));
}

result spawn_attr::set_sigmask(sig_set const& mask)
{
	return check_code(posix_spawnattr_setsigmask(&attr_, &mask.native()));
}

result spawn_attr::get_sigmask(sig_set& mask) const
{
	return check_code(posix_spawnattr_getsigmask(&attr_, &mask.native()));
}

result spawn_attr::set_sigdefault(sig_set const& signals)
{
	return check_code(posix_spawnattr_setsigdefault(&attr_, &signals.native()));
}

result spawn_attr::get_sigdefault(sig_set& signals) const
{
	return check_code(posix_spawnattr_getsigdefault(&attr_, &signals.native()));
}

namespace {
typedef int (*spawn_func)(pid_t*, char const*, posix_spawn_file_actions_t const*, posix_spawnattr_t const*, char* const*, char* const*);

result do_spawn(spawn_func f, pid_t& pid, path_arg path, spawn_file_actions const* actions, spawn_attr const* attr,
	char* const* argv, char* const* envp)
{
	return path.with_cstr([&](cstring_view p) -> result {
		// Descriptors created by a forkblock holder have FD_CLOEXEC set once it is released
		scoped_lock l(forkblock_mutex());

		pid_t child{};
		int res = f(&child, p.c_str(), actions ? actions->native() : nullptr, attr ? attr->native() : nullptr, argv, envp);
		if (res) {
			return result_from_errno(res);
		}

		pid = child;
		return {result::ok};
	});
}
}

result spawn(pid_t& pid, path_arg path, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv, cstring_vec const& envp)
{
	return do_spawn(&posix_spawn, pid, path, actions, attr, argv.data(), envp.data());
}

result spawn(pid_t& pid, path_arg path, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv)
{
	return do_spawn(&posix_spawn, pid, path, actions, attr, argv.data(), environ);
}

result spawnp(pid_t& pid, path_arg file, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv, cstring_vec const& envp)
{
	return do_spawn(&posix_spawnp, pid, file, actions, attr, argv.data(), envp.data());
}

result spawnp(pid_t& pid, path_arg file, spawn_file_actions const* actions, spawn_attr const* attr,
	cstring_vec const& argv)
{
	return do_spawn(&posix_spawnp, pid, file, actions, attr, argv.data(), environ);
}

result wait_pid(pid_t pid, int& status, int options, pid_t* reaped)
{
	pid_t ret;
	do {
	} while ((ret = ::waitpid(pid, &status, options)) == -1 && errno == EINTR);

	if (ret == -1) {
		return result_from_errno(errno);
	}

	if (reaped) {
		*reaped = ret;
	}
	return {result::ok};
}

std::optional<int> exit_status(int status)
{
	if (WIFEXITED(status)) {
		return WEXITSTATUS(status);
	}
	return {};
}

std::optional<int> term_signal(int status)
{
	if (WIFSIGNALED(status)) {
		return WTERMSIG(status);
	}
	return {};
}

}
