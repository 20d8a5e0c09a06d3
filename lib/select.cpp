#include "syscall.hpp"
#include "libsafix/format.hpp"
#include "libsafix/select.hpp"

#include <cstdlib>
#include <iostream>

namespace sfx {

namespace {
fd_set* native_or_null(descriptor_set* set)
{
	return set ? &set->native() : nullptr;
}

result finish(int ret, size_t& ready)
{
	if (ret == -1) {
		return result_from_errno(errno);
	}
	ready = static_cast<size_t>(ret);
	return {result::ok};
}
}

descriptor_set::descriptor_set()
{
	FD_ZERO(&set_);
}

void descriptor_set::add(int fd)
{
	if (!can_contain(fd)) {
		std::cerr << sprintf("sfx::descriptor_set::add: descriptor %d does not fit into an fd_set of size %d\n", fd, FD_SETSIZE);
		std::abort();
	}
	FD_SET(fd, &set_);
}

void descriptor_set::remove(int fd)
{
	if (can_contain(fd)) {
		FD_CLR(fd, &set_);
	}
}

bool descriptor_set::contains(int fd) const
{
	return can_contain(fd) && FD_ISSET(fd, &set_);
}

void descriptor_set::clear()
{
	FD_ZERO(&set_);
}

std::vector<int> descriptor_set::descriptors(int nfds) const
{
	std::vector<int> ret;
	if (nfds > FD_SETSIZE) {
		nfds = FD_SETSIZE;
	}
	for (int fd = 0; fd < nfds; ++fd) {
		if (FD_ISSET(fd, &set_)) {
			ret.push_back(fd);
		}
	}
	return ret;
}

result select(int nfds, descriptor_set* read, descriptor_set* write, descriptor_set* except,
	timeval const* timeout, size_t& ready)
{
	// select may modify the timeout
	timeval copy{};
	if (timeout) {
		copy = *timeout;
	}
	int ret = ::select(nfds, native_or_null(read), native_or_null(write), native_or_null(except), timeout ? &copy : nullptr);
	return finish(ret, ready);
}

result pselect(int nfds, descriptor_set* read, descriptor_set* write, descriptor_set* except,
	timespec const* timeout, sig_set const* sigmask, size_t& ready)
{
	int ret = ::pselect(nfds, native_or_null(read), native_or_null(write), native_or_null(except), timeout,
		sigmask ? &sigmask->native() : nullptr);
	return finish(ret, ready);
}

}
