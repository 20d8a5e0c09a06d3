#ifndef LIBSAFIX_POLL_HEADER
#define LIBSAFIX_POLL_HEADER

#include "signal.hpp"

#include <vector>

#include <poll.h>
#include <time.h>

/** \file
 * \brief Waiting for descriptors to become ready with poll and ppoll
 */

namespace sfx {

/// Event bits of struct pollfd
enum class poll_event : short
{
	none = 0,
	in = POLLIN,
	pri = POLLPRI,
	out = POLLOUT,

	/// Only ever returned, never requested
	err = POLLERR,
	hup = POLLHUP,
	nval = POLLNVAL
};
SFX_ENUM_FLAG_OPERATORS(poll_event)

inline pollfd make_pollfd(int fd, poll_event events)
{
	pollfd ret{};
	ret.fd = fd;
	ret.events = static_cast<short>(events);
	return ret;
}

/// The events that occurred on a descriptor after \ref poll returned
inline poll_event returned_events(pollfd const& p)
{
	return static_cast<poll_event>(p.revents);
}

/** \brief Waits for one of the descriptors to become ready
 *
 * \param timeout In milliseconds, -1 to wait indefinitely.
 * \param ready Receives the number of descriptors with non-zero revents. 0 on timeout.
 */
result SFX_PUBLIC_SYMBOL poll(std::vector<pollfd>& fds, int timeout, size_t& ready);

/** \brief Like \ref poll, but atomically sets the signal mask while waiting.
 *
 * A null timeout waits indefinitely, a null sigmask leaves the mask unchanged.
 * Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL ppoll(std::vector<pollfd>& fds, timespec const* timeout, sig_set const* sigmask, size_t& ready);

}

#endif
