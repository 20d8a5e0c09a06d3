#ifndef LIBSAFIX_CLOCK_HEADER
#define LIBSAFIX_CLOCK_HEADER

#include "error.hpp"

#include <chrono>

#include <time.h>

/** \file
 * \brief Reading the POSIX clocks
 */

namespace sfx {

enum class clock_id : int
{
	/// Wall-clock time, can jump
	realtime = CLOCK_REALTIME,

	/// Never goes backwards, does not count while suspended on Linux
	monotonic = CLOCK_MONOTONIC,

	/// CPU time consumed by the process
	process_cputime = CLOCK_PROCESS_CPUTIME_ID,

	/// CPU time consumed by the calling thread
	thread_cputime = CLOCK_THREAD_CPUTIME_ID,

#if SFX_LINUX
	/// Like monotonic, but includes time spent suspended
	boottime = CLOCK_BOOTTIME,
#endif
};

/// Gets the current time of the clock. For realtime, this is the time since the epoch.
result SFX_PUBLIC_SYMBOL clock_gettime(clock_id clock, std::chrono::nanoseconds& out);

/// Gets the resolution of the clock
result SFX_PUBLIC_SYMBOL clock_getres(clock_id clock, std::chrono::nanoseconds& out);

}

#endif
