#ifndef LIBSAFIX_RESOURCE_HEADER
#define LIBSAFIX_RESOURCE_HEADER

#include "error.hpp"

#include <chrono>

#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>

/** \file
 * \brief Resource limits, resource usage and scheduling priorities
 */

namespace sfx {

/// The limits for \ref getrlimit and \ref setrlimit
enum class resource : int
{
	/// Maximum size of core files
	core = RLIMIT_CORE,

	/// CPU time in seconds
	cpu = RLIMIT_CPU,
	data = RLIMIT_DATA,

	/// Maximum size of files the process may create
	fsize = RLIMIT_FSIZE,

	/// One greater than the maximum file descriptor number
	nofile = RLIMIT_NOFILE,
	stack = RLIMIT_STACK,

	/// Maximum size of the address space
	as = RLIMIT_AS,
#ifdef RLIMIT_NPROC
	nproc = RLIMIT_NPROC,
#endif
#ifdef RLIMIT_MEMLOCK
	memlock = RLIMIT_MEMLOCK,
#endif
#ifdef RLIMIT_RSS
	rss = RLIMIT_RSS,
#endif
};

/// No limit
constexpr rlim_t rlim_infinity = RLIM_INFINITY;

/// The soft limit is enforced, the hard limit is the ceiling for the soft limit
struct rlimit_pair
{
	rlim_t soft{};
	rlim_t hard{};
};

result SFX_PUBLIC_SYMBOL getrlimit(resource r, rlimit_pair& limits);

/// Only privileged processes may raise the hard limit
result SFX_PUBLIC_SYMBOL setrlimit(resource r, rlimit_pair const& limits);

enum class rusage_who : int
{
	self = RUSAGE_SELF,

	/// Terminated and reaped children
	children = RUSAGE_CHILDREN,
#ifdef RUSAGE_THREAD
	thread = RUSAGE_THREAD,
#endif
};

/// Resource usage, wraps struct rusage
class SFX_PUBLIC_SYMBOL rusage_info final
{
public:
	/// User CPU time
	std::chrono::microseconds utime() const;

	/// System CPU time
	std::chrono::microseconds stime() const;

	/// Maximum resident set size. Kilobytes on Linux, bytes on macOS.
	long maxrss() const { return usage_.ru_maxrss; }

	long minflt() const { return usage_.ru_minflt; }
	long majflt() const { return usage_.ru_majflt; }

	/// Voluntary context switches
	long nvcsw() const { return usage_.ru_nvcsw; }

	/// Involuntary context switches
	long nivcsw() const { return usage_.ru_nivcsw; }

	struct rusage const& native() const { return usage_; }
	struct rusage& native() { return usage_; }

private:
	struct rusage usage_{};
};

result SFX_PUBLIC_SYMBOL getrusage(rusage_who who, rusage_info& out);

enum class priority_which : int
{
	process = PRIO_PROCESS,
	pgrp = PRIO_PGRP,
	user = PRIO_USER
};

/** \brief Gets the nice value
 *
 * \c who is a process ID, process group ID or user ID depending on \c which. 0 means the caller.
 */
result SFX_PUBLIC_SYMBOL getpriority(priority_which which, id_t who, int& prio);
result SFX_PUBLIC_SYMBOL setpriority(priority_which which, id_t who, int prio);

}

#endif
