#ifndef LIBSAFIX_SELECT_HEADER
#define LIBSAFIX_SELECT_HEADER

#include "signal.hpp"

#include <vector>

#include <sys/select.h>
#include <sys/time.h>
#include <time.h>

/** \file
 * \brief Waiting for descriptors with select and pselect
 *
 * Prefer \ref poll, select cannot handle descriptors of FD_SETSIZE or above.
 */

namespace sfx {

/** \brief A set of file descriptors, wraps fd_set
 *
 * Adding a descriptor that cannot be represented is a programmer error and
 * aborts the process, check with \ref can_contain first.
 */
class SFX_PUBLIC_SYMBOL descriptor_set final
{
public:
	/// Creates an empty set
	descriptor_set();

	/// True if fd is in the range 0 to FD_SETSIZE - 1
	static bool can_contain(int fd) { return fd >= 0 && fd < FD_SETSIZE; }

	void add(int fd);

	/// Does nothing for descriptors that cannot be represented
	void remove(int fd);

	/// False for descriptors that cannot be represented
	bool contains(int fd) const;

	void clear();

	/// The descriptors below nfds in the set, in ascending order
	std::vector<int> descriptors(int nfds = FD_SETSIZE) const;

	fd_set const& native() const { return set_; }
	fd_set& native() { return set_; }

private:
	fd_set set_;
};

/** \brief Waits for descriptors in the sets to become ready.
 *
 * \param nfds One more than the highest descriptor in any of the sets.
 * \param read, write, except May be null. On success only the ready descriptors remain.
 * \param timeout Null to wait indefinitely. Is not modified.
 * \param ready Receives the total number of ready descriptors, 0 on timeout.
 */
result SFX_PUBLIC_SYMBOL select(int nfds, descriptor_set* read, descriptor_set* write, descriptor_set* except,
	timeval const* timeout, size_t& ready);

/// Like \ref select, but with a timespec and atomically setting the signal mask while waiting. A null sigmask leaves the mask unchanged.
result SFX_PUBLIC_SYMBOL pselect(int nfds, descriptor_set* read, descriptor_set* write, descriptor_set* except,
	timespec const* timeout, sig_set const* sigmask, size_t& ready);

}

#endif
