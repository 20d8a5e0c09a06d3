#include "syscall.hpp"
#include "libsafix/format.hpp"
#include "libsafix/signal.hpp"

#include <pthread.h>
#include <string.h>

namespace sfx {

sig_set::sig_set()
{
	sigemptyset(&set_);
}

sig_set sig_set::empty()
{
	return sig_set();
}

sig_set sig_set::full()
{
	sig_set ret;
	ret.fill();
	return ret;
}

result sig_set::add(int sig)
{
	return check(sigaddset(&set_, sig));
}

result sig_set::remove(int sig)
{
	return check(sigdelset(&set_, sig));
}

bool sig_set::contains(int sig) const
{
	return sigismember(&set_, sig) == 1;
}

void sig_set::clear()
{
	sigemptyset(&set_);
}

void sig_set::fill()
{
	sigfillset(&set_);
}

bool sig_set::is_empty() const
{
#if SFX_LINUX && defined(__GLIBC__)
	return sigisemptyset(&set_) == 1;
#else
	for (int sig = 1; sig < NSIG; ++sig) {
		if (sigismember(&set_, sig) == 1) {
			return false;
		}
	}
	return true;
#endif
}

result kill(pid_t pid, int sig)
{
	return check(::kill(pid, sig));
}

result killpg(pid_t pgrp, int sig)
{
	return check(::killpg(pgrp, sig));
}

result raise(int sig)
{
	// raise returns nonzero on failure, not necessarily -1
	if (::raise(sig) != 0) {
		return result_from_errno(errno);
	}
	return {result::ok};
}

result thread_mask(sigmask_how how, sig_set const* set, sig_set& old)
{
	return check_code(pthread_sigmask(static_cast<int>(how), set ? &set->native() : nullptr, &old.native()));
}

result sigprocmask(sigmask_how how, sig_set const* set, sig_set& old)
{
	return check(::sigprocmask(static_cast<int>(how), set ? &set->native() : nullptr, &old.native()));
}

result sigpending(sig_set& out)
{
	return check(::sigpending(&out.native()));
}

result sigwait(sig_set const& set, int& sig)
{
	return check_code(::sigwait(&set.native(), &sig));
}

namespace {
result set_disposition(int sig, void (*handler)(int))
{
	struct sigaction sa{};
	sa.sa_handler = handler;
	sigemptyset(&sa.sa_mask);
	return check(::sigaction(sig, &sa, nullptr));
}
}

result ignore_signal(int sig)
{
	return set_disposition(sig, SIG_IGN);
}

result default_signal(int sig)
{
	return set_disposition(sig, SIG_DFL);
}

std::string signal_name(int sig)
{
#define SIGNAL(s) case s: return #s;
	switch (sig) {
	SIGNAL(SIGHUP)
	SIGNAL(SIGINT)
	SIGNAL(SIGQUIT)
	SIGNAL(SIGILL)
	SIGNAL(SIGTRAP)
	SIGNAL(SIGABRT)
	SIGNAL(SIGBUS)
	SIGNAL(SIGFPE)
	SIGNAL(SIGKILL)
	SIGNAL(SIGUSR1)
	SIGNAL(SIGSEGV)
	SIGNAL(SIGUSR2)
	SIGNAL(SIGPIPE)
	SIGNAL(SIGALRM)
	SIGNAL(SIGTERM)
	SIGNAL(SIGCHLD)
	SIGNAL(SIGCONT)
	SIGNAL(SIGSTOP)
	SIGNAL(SIGTSTP)
	SIGNAL(SIGTTIN)
	SIGNAL(SIGTTOU)
	SIGNAL(SIGURG)
	SIGNAL(SIGXCPU)
	SIGNAL(SIGXFSZ)
	SIGNAL(SIGVTALRM)
	SIGNAL(SIGPROF)
	SIGNAL(SIGWINCH)
	SIGNAL(SIGIO)
	SIGNAL(SIGSYS)
#ifdef SIGSTKFLT
	SIGNAL(SIGSTKFLT)
#endif
#if defined(SIGPWR) && SIGPWR != SIGIO
	SIGNAL(SIGPWR)
#endif
#ifdef SIGEMT
	SIGNAL(SIGEMT)
#endif
#ifdef SIGINFO
	SIGNAL(SIGINFO)
#endif
	default:
		break;
	}
#undef SIGNAL

#ifdef SIGRTMIN
	if (sig >= SIGRTMIN && sig <= SIGRTMAX) {
		if (sig == SIGRTMIN) {
			return "SIGRTMIN";
		}
		return sfx::sprintf("SIGRTMIN+%d", sig - SIGRTMIN);
	}
#endif

	return std::string();
}

}
