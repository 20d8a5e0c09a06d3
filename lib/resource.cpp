#include "syscall.hpp"
#include "libsafix/resource.hpp"

namespace sfx {

namespace {
std::chrono::microseconds to_duration(timeval const& tv)
{
	return std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
}
}

result getrlimit(resource r, rlimit_pair& limits)
{
	struct rlimit l{};
	if (::getrlimit(static_cast<int>(r), &l) == -1) {
		return result_from_errno(errno);
	}

	limits.soft = l.rlim_cur;
	limits.hard = l.rlim_max;
	return {result::ok};
}

result setrlimit(resource r, rlimit_pair const& limits)
{
	struct rlimit l{};
	l.rlim_cur = limits.soft;
	l.rlim_max = limits.hard;
	return check(::setrlimit(static_cast<int>(r), &l));
}

std::chrono::microseconds rusage_info::utime() const
{
	return to_duration(usage_.ru_utime);
}

std::chrono::microseconds rusage_info::stime() const
{
	return to_duration(usage_.ru_stime);
}

result getrusage(rusage_who who, rusage_info& out)
{
	return check(::getrusage(static_cast<int>(who), &out.native()));
}

result getpriority(priority_which which, id_t who, int& prio)
{
	// -1 is a valid priority
	errno = 0;
	int ret = ::getpriority(static_cast<int>(which), who);
	if (ret == -1 && errno) {
		return result_from_errno(errno);
	}

	prio = ret;
	return {result::ok};
}

result setpriority(priority_which which, id_t who, int prio)
{
	return check(::setpriority(static_cast<int>(which), who, prio));
}

}
