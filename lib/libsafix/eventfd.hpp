#ifndef LIBSAFIX_EVENTFD_HEADER
#define LIBSAFIX_EVENTFD_HEADER

#include "file_desc.hpp"

#include <fcntl.h>
#include <stdint.h>

/** \file
 * \brief Event counters on Linux: eventfd
 *
 * The functions fail with ENOSYS on other systems.
 */

namespace sfx {

/// Flags for \ref eventfd, matching the EFD_* constants
enum class eventfd_flag : int
{
	none = 0,

	/// Each read returns 1 and decrements the counter by 1
	semaphore = 1,

	nonblock = O_NONBLOCK,
	cloexec = O_CLOEXEC
};
SFX_ENUM_FLAG_OPERATORS(eventfd_flag)

/// Creates an event counter starting at initval
result SFX_PUBLIC_SYMBOL eventfd(file_desc& out, unsigned int initval, eventfd_flag flags = eventfd_flag::cloexec);

/** \brief Reads the counter and resets it to 0, or decrements it by 1 in semaphore mode.
 *
 * Blocks while the counter is 0, unless the descriptor is non-blocking.
 */
result SFX_PUBLIC_SYMBOL eventfd_read(int fd, uint64_t& value);

/// Adds value to the counter. Blocks if the counter would exceed 0xfffffffffffffffe.
result SFX_PUBLIC_SYMBOL eventfd_write(int fd, uint64_t value);

}

#endif
