#ifndef LIBSAFIX_GLUE_UNIX_HEADER
#define LIBSAFIX_GLUE_UNIX_HEADER

/** \file
 * \brief Descriptor plumbing on raw file descriptors.
 *
 * These work on plain ints and return errno-style values. The
 * \ref sfx::file_desc based wrappers in unistd.hpp and socket.hpp are built on top.
 */

#include "../libsafix.hpp"

namespace sfx {

/**
 * \brief Sets FD_CLOEXEC on file descriptor
 *
 * Returns 0 on success, errno otherwise.
 *
 * If you use this function, you probably also want to use \ref sfx::forkblock
 */
int SFX_PUBLIC_SYMBOL set_cloexec(int fd, bool cloexec = true);

/**
 * \brief Creates a pipe with FD_CLOEXEC set
 *
 * If present uses pipe2 so it's set atomically, falls
 * back to fcntl under a \ref forkblock.
 *
 * Returns 0 on success, errno otherwise. On failure sets fds to -1.
 */
int SFX_PUBLIC_SYMBOL create_pipe(int fds[2]);

/** \brief Disables SIGPIPE
 *
 * Writing to a pipe or socket without reader then fails with EPIPE instead
 * of killing the process.
 *
 * Affects the whole process. The ignored disposition is inherited by children
 * started with \ref sfx::spawn, unless they are spawned with
 * spawn_flag::setsigdef and SIGPIPE in \ref spawn_attr::set_sigdefault.
 * None of the other functions in this library call it.
 */
void SFX_PUBLIC_SYMBOL disable_sigpipe();

/// Creates a connected pair of unix domain sockets of the given type with FD_CLOEXEC set. Returns 0 or errno.
int SFX_PUBLIC_SYMBOL create_socketpair(int fds[2], int type);

/// Returns 0 on success, errno otherwise
int SFX_PUBLIC_SYMBOL set_nonblocking(int fd, bool non_blocking = true);

/** \brief Temporarily suppress fork() if CLOEXEC cannot be set atomically at creation
 *
 * \ref sfx::spawn and \ref sfx::spawnp wait until there is no forkblock.
 *
 * In case of a wild fork() in third-party code, pthread_atfork handlers will enforce a wait.
 * This may deadlock. Behavior is undefined if fork is called from a signal handler.
 *
 * If you fork while the current thread holds a forkblock, the child will immediately exit.
 */
class SFX_PUBLIC_SYMBOL forkblock final
{
public:
	forkblock();
	~forkblock();

	forkblock(forkblock const&) = delete;
	forkblock& operator=(forkblock const&) = delete;
};

}

#endif
