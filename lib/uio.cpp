#include "syscall.hpp"
#include "libsafix/uio.hpp"

#include <limits.h>

namespace sfx {

namespace {
int clamp_count(size_t count)
{
	return count > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(count);
}
}

void advance_iovecs(std::vector<iovec>& iov, size_t n)
{
	size_t consumed{};
	while (consumed < iov.size()) {
		iovec& first = iov[consumed];
		if (n < first.iov_len) {
			first.iov_base = static_cast<char*>(first.iov_base) + n;
			first.iov_len -= n;
			break;
		}
		n -= first.iov_len;
		++consumed;
	}
	iov.erase(iov.begin(), iov.begin() + consumed);
}

size_t iovecs_size(std::vector<iovec> const& iov)
{
	size_t ret{};
	for (auto const& v : iov) {
		ret += v.iov_len;
	}
	return ret;
}

rwresult readv(int fd, iovec const* iov, size_t count)
{
	return check_size(::readv(fd, iov, clamp_count(count)));
}

rwresult writev(int fd, iovec const* iov, size_t count)
{
	return check_size(::writev(fd, iov, clamp_count(count)));
}

rwresult preadv([[maybe_unused]] int fd, [[maybe_unused]] iovec const* iov, [[maybe_unused]] size_t count, [[maybe_unused]] off_t offset)
{
#if HAVE_PREADV
	return check_size(::preadv(fd, iov, clamp_count(count), offset));
#else
	return rwresult{rwresult::other, ENOSYS};
#endif
}

rwresult pwritev([[maybe_unused]] int fd, [[maybe_unused]] iovec const* iov, [[maybe_unused]] size_t count, [[maybe_unused]] off_t offset)
{
#if HAVE_PWRITEV
	return check_size(::pwritev(fd, iov, clamp_count(count), offset));
#else
	return rwresult{rwresult::other, ENOSYS};
#endif
}

}
