#ifndef LIBSAFIX_PIDFD_HEADER
#define LIBSAFIX_PIDFD_HEADER

#include "file_desc.hpp"

#include <sys/types.h>

/** \file
 * \brief Process file descriptors on Linux
 *
 * A pidfd refers to one process and cannot be confused with a later process
 * reusing the same ID. It becomes readable once the process terminates.
 * All functions fail with ENOSYS where the kernel or system lacks them.
 */

namespace sfx {

/// Opens a descriptor for the process. FD_CLOEXEC is always set on it.
result SFX_PUBLIC_SYMBOL pidfd_open(file_desc& out, pid_t pid, unsigned int flags = 0);

/** \brief Duplicates a descriptor of another process into the calling process.
 *
 * Requires permission to ptrace the target. FD_CLOEXEC is always set on the copy.
 */
result SFX_PUBLIC_SYMBOL pidfd_getfd(file_desc& out, int pidfd, int targetfd, unsigned int flags = 0);

/// Sends a signal to the process the pidfd refers to
result SFX_PUBLIC_SYMBOL pidfd_send_signal(int pidfd, int sig, unsigned int flags = 0);

}

#endif
