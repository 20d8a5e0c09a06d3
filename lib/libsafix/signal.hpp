#ifndef LIBSAFIX_SIGNAL_HEADER
#define LIBSAFIX_SIGNAL_HEADER

#include "error.hpp"

#include <string>

#include <signal.h>
#include <sys/types.h>

/** \file
 * \brief Signal sets, signal masks and sending signals
 */

namespace sfx {

/// A set of signals, wraps sigset_t
class SFX_PUBLIC_SYMBOL sig_set final
{
public:
	/// Creates an empty set
	sig_set();

	static sig_set empty();
	static sig_set full();

	/// Fails with EINVAL for invalid signal numbers
	result add(int sig);
	result remove(int sig);

	/// False for invalid signal numbers
	bool contains(int sig) const;

	void clear();
	void fill();

	bool is_empty() const;

	sigset_t const& native() const { return set_; }
	sigset_t& native() { return set_; }

private:
	sigset_t set_;
};

/// Sends a signal to a process. Pass 0 as sig to merely check whether the process exists.
result SFX_PUBLIC_SYMBOL kill(pid_t pid, int sig);

/// Sends a signal to a process group
result SFX_PUBLIC_SYMBOL killpg(pid_t pgrp, int sig);

/// Sends a signal to the calling thread
result SFX_PUBLIC_SYMBOL raise(int sig);

/// How \ref thread_mask changes the signal mask
enum class sigmask_how : int
{
	block = SIG_BLOCK,
	unblock = SIG_UNBLOCK,
	set = SIG_SETMASK
};

/** \brief Examines and changes the signal mask of the calling thread
 *
 * If \c set is null, the mask is left unchanged. The previous mask is stored in \c old.
 */
result SFX_PUBLIC_SYMBOL thread_mask(sigmask_how how, sig_set const* set, sig_set& old);

/// Like \ref thread_mask, for single-threaded processes
result SFX_PUBLIC_SYMBOL sigprocmask(sigmask_how how, sig_set const* set, sig_set& old);

/// Gets the signals pending on the calling thread
result SFX_PUBLIC_SYMBOL sigpending(sig_set& out);

/** \brief Waits for one of the signals in set
 *
 * The signals must be blocked before calling this.
 */
result SFX_PUBLIC_SYMBOL sigwait(sig_set const& set, int& sig);

/// Sets the disposition of sig to SIG_IGN
result SFX_PUBLIC_SYMBOL ignore_signal(int sig);

/// Sets the disposition of sig to SIG_DFL
result SFX_PUBLIC_SYMBOL default_signal(int sig);

/** \brief Gets the symbolic name of a signal
 *
 * For example, <tt>signal_name(SIGINT) == "SIGINT"</tt>. Realtime signals on
 * Linux are named relative to SIGRTMIN, e.g. "SIGRTMIN+2". Returns an empty
 * string for unknown values.
 */
std::string SFX_PUBLIC_SYMBOL signal_name(int sig);

}

#endif
