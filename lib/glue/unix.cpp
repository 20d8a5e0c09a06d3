#include "../syscall.hpp"
#include "../libsafix/glue/unix.hpp"
#include "../libsafix/mutex.hpp"

#include <atomic>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace sfx {

namespace {
std::atomic<unsigned int> forkblocks_{};
mutex forkblock_mtx_;
bool forked_child_{};

void atfork_lock_forkblock()
{
	// Unsafe if fork is called from a signal handler
	if (!forked_child_) {
		forkblock_mtx_.lock();
	}
}

void atfork_unlock_forkblock()
{
	// Unsafe if fork is called from a signal handler
	if (!forked_child_) {
		forkblock_mtx_.unlock();
	}
}

void atfork_check_forkblocks()
{
	// Last line of defense.
	if (forkblocks_) {
		_exit(1);
	}
	forked_child_ = true;
}

int const atfork_registered = []() {
	return pthread_atfork(&atfork_lock_forkblock, &atfork_unlock_forkblock, &atfork_check_forkblocks);
}();
}

mutex& forkblock_mutex()
{
	return forkblock_mtx_;
}

forkblock::forkblock()
{
	forkblock_mtx_.lock();
	++forkblocks_;
}

forkblock::~forkblock()
{
	--forkblocks_;
	forkblock_mtx_.unlock();
}

int set_cloexec(int fd, bool cloexec)
{
	int flags = ::fcntl(fd, F_GETFD);
	if (flags == -1) {
		return errno;
	}

	int const new_flags = cloexec ? (flags | FD_CLOEXEC) : (flags & ~FD_CLOEXEC);
	if (new_flags != flags && ::fcntl(fd, F_SETFD, new_flags) == -1) {
		return errno;
	}
	return 0;
}

int create_pipe(int fds[2])
{
	fds[0] = -1;
	fds[1] = -1;

#if HAVE_PIPE2
	int res = ::pipe2(fds, O_CLOEXEC);
	if (!res) {
		return 0;
	}
	else if (errno != ENOSYS) {
		int const err = errno;
		fds[0] = -1;
		fds[1] = -1;
		return err;
	}
	else
#endif
	{
		forkblock b;
		if (::pipe(fds) != 0) {
			int const err = errno;
			fds[0] = -1;
			fds[1] = -1;
			return err;
		}

		int err = set_cloexec(fds[0]);
		if (!err) {
			err = set_cloexec(fds[1]);
		}
		if (err) {
			::close(fds[0]);
			::close(fds[1]);
			fds[0] = -1;
			fds[1] = -1;
			return err;
		}
	}

	return 0;
}

void disable_sigpipe()
{
	[[maybe_unused]] static bool const once = []() { signal(SIGPIPE, SIG_IGN); return true; }();
}

int create_socketpair(int fds[2], int type)
{
#if HAVE_SOCK_CLOEXEC
	type |= SOCK_CLOEXEC;
#else
	forkblock b;
#endif
	if (::socketpair(AF_UNIX, type, 0, fds) != 0) {
		int const err = errno;
		fds[0] = -1;
		fds[1] = -1;
		return err;
	}
#if !HAVE_SOCK_CLOEXEC
	int err = set_cloexec(fds[0]);
	if (!err) {
		err = set_cloexec(fds[1]);
	}
	if (err) {
		::close(fds[0]);
		::close(fds[1]);
		fds[0] = -1;
		fds[1] = -1;
		return err;
	}
#endif

	return 0;
}

int set_nonblocking(int fd, bool non_blocking)
{
	int flags = ::fcntl(fd, F_GETFL);
	if (flags == -1) {
		return errno;
	}
	if (non_blocking) {
		flags |= O_NONBLOCK;
	}
	else {
		flags &= ~O_NONBLOCK;
	}

	int res = ::fcntl(fd, F_SETFL, flags);
	if (res == -1) {
		return errno;
	}
	return 0;
}

}
