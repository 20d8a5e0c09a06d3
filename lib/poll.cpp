#include "syscall.hpp"
#include "libsafix/poll.hpp"

namespace sfx {

result poll(std::vector<pollfd>& fds, int timeout, size_t& ready)
{
	int ret = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout);
	if (ret == -1) {
		return result_from_errno(errno);
	}

	ready = static_cast<size_t>(ret);
	return {result::ok};
}

result ppoll([[maybe_unused]] std::vector<pollfd>& fds, [[maybe_unused]] timespec const* timeout,
	[[maybe_unused]] sig_set const* sigmask, [[maybe_unused]] size_t& ready)
{
#if HAVE_PPOLL
	int ret = ::ppoll(fds.data(), static_cast<nfds_t>(fds.size()), timeout, sigmask ? &sigmask->native() : nullptr);
	if (ret == -1) {
		return result_from_errno(errno);
	}

	ready = static_cast<size_t>(ret);
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

}
