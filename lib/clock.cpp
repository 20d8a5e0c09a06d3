#include "syscall.hpp"
#include "libsafix/clock.hpp"

namespace sfx {

namespace {
std::chrono::nanoseconds to_duration(timespec const& ts)
{
	return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
}
}

result clock_gettime(clock_id clock, std::chrono::nanoseconds& out)
{
	timespec ts{};
	if (::clock_gettime(static_cast<clockid_t>(clock), &ts) == -1) {
		return result_from_errno(errno);
	}

	out = to_duration(ts);
	return {result::ok};
}

result clock_getres(clock_id clock, std::chrono::nanoseconds& out)
{
	timespec ts{};
	if (::clock_getres(static_cast<clockid_t>(clock), &ts) == -1) {
		return result_from_errno(errno);
	}

	out = to_duration(ts);
	return {result::ok};
}

}
