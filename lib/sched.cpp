#include "syscall.hpp"
#include "libsafix/sched.hpp"

#include <sched.h>

namespace sfx {

void sched_yield()
{
	::sched_yield();
}

result cpu_set::add(unsigned int cpu)
{
	if (cpu >= max_cpus) {
		return invalid_argument<result>();
	}
	bits_.set(cpu);
	return {result::ok};
}

void cpu_set::remove(unsigned int cpu)
{
	if (cpu < max_cpus) {
		bits_.reset(cpu);
	}
}

bool cpu_set::contains(unsigned int cpu) const
{
	return cpu < max_cpus && bits_.test(cpu);
}

std::vector<unsigned int> cpu_set::cpus() const
{
	std::vector<unsigned int> ret;
	ret.reserve(count());
	for (unsigned int i = 0; i < max_cpus; ++i) {
		if (bits_.test(i)) {
			ret.push_back(i);
		}
	}
	return ret;
}

#if HAVE_SCHED_GETAFFINITY
static_assert(static_cast<unsigned int>(CPU_SETSIZE) >= cpu_set::max_cpus, "cpu_set_t cannot hold all CPUs of a cpu_set");
#endif

result sched_setaffinity([[maybe_unused]] pid_t pid, [[maybe_unused]] cpu_set const& set)
{
#if HAVE_SCHED_GETAFFINITY
	cpu_set_t native;
	CPU_ZERO(&native);
	for (unsigned int cpu : set.cpus()) {
		CPU_SET(cpu, &native);
	}
	return check(::sched_setaffinity(pid, sizeof(native), &native));
#else
	return {result::other, ENOSYS};
#endif
}

result sched_getaffinity([[maybe_unused]] pid_t pid, [[maybe_unused]] cpu_set& out)
{
#if HAVE_SCHED_GETAFFINITY
	cpu_set_t native;
	CPU_ZERO(&native);
	auto r = check(::sched_getaffinity(pid, sizeof(native), &native));
	if (!r) {
		return r;
	}

	cpu_set ret;
	for (unsigned int cpu = 0; cpu < cpu_set::max_cpus; ++cpu) {
		if (CPU_ISSET(cpu, &native)) {
			ret.native().set(cpu);
		}
	}
	out = ret;
	return r;
#else
	return {result::other, ENOSYS};
#endif
}

result sched_getcpu([[maybe_unused]] unsigned int& cpu)
{
#if HAVE_SCHED_GETCPU
	int ret = ::sched_getcpu();
	if (ret == -1) {
		return result_from_errno(errno);
	}
	cpu = static_cast<unsigned int>(ret);
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

}
