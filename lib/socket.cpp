#include "syscall.hpp"
#include "libsafix/format.hpp"
#include "libsafix/glue/unix.hpp"
#include "libsafix/socket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <stddef.h>
#include <string.h>

namespace sfx {

namespace {
union sockaddr_u
{
	sockaddr_storage storage;
	sockaddr sockaddr_;
	sockaddr_in in4;
	sockaddr_in6 in6;
	sockaddr_un un;
};

bool parse_port(std::string_view s, uint16_t& port)
{
	if (s.empty() || s.size() > 5) {
		return false;
	}

	unsigned int v{};
	for (char c : s) {
		if (c < '0' || c > '9') {
			return false;
		}
		v = v * 10 + static_cast<unsigned int>(c - '0');
	}
	if (v > 65535) {
		return false;
	}

	port = static_cast<uint16_t>(v);
	return true;
}
}

inet4_address::inet4_address()
{
	addr_.sin_family = AF_INET;
}

inet4_address::inet4_address(std::array<uint8_t, 4> const& octets, uint16_t port)
{
	addr_.sin_family = AF_INET;
	addr_.sin_port = htons(port);
	memcpy(&addr_.sin_addr, octets.data(), octets.size());
}

inet4_address::inet4_address(sockaddr_in const& addr)
	: addr_(addr)
{
}

std::optional<inet4_address> inet4_address::parse(std::string_view s)
{
	auto pos = s.find(':');
	if (pos == std::string_view::npos) {
		return {};
	}

	uint16_t port{};
	if (!parse_port(s.substr(pos + 1), port)) {
		return {};
	}

	inet4_address ret;
	std::string const host(s.substr(0, pos));
	if (inet_pton(AF_INET, host.c_str(), &ret.addr_.sin_addr) != 1) {
		return {};
	}
	ret.set_port(port);

	return ret;
}

uint16_t inet4_address::port() const
{
	return ntohs(addr_.sin_port);
}

void inet4_address::set_port(uint16_t port)
{
	addr_.sin_port = htons(port);
}

std::array<uint8_t, 4> inet4_address::octets() const
{
	std::array<uint8_t, 4> ret;
	memcpy(ret.data(), &addr_.sin_addr, ret.size());
	return ret;
}

bool inet4_address::is_unspecified() const
{
	return octets() == std::array<uint8_t, 4>{0, 0, 0, 0};
}

bool inet4_address::is_loopback() const
{
	return octets()[0] == 127;
}

bool inet4_address::is_private() const
{
	auto const o = octets();
	return o[0] == 10 ||
		(o[0] == 172 && (o[1] & 0xf0) == 16) ||
		(o[0] == 192 && o[1] == 168);
}

bool inet4_address::is_link_local() const
{
	auto const o = octets();
	return o[0] == 169 && o[1] == 254;
}

bool inet4_address::is_broadcast() const
{
	return octets() == std::array<uint8_t, 4>{255, 255, 255, 255};
}

std::string inet4_address::to_string() const
{
	auto const o = octets();
	return sfx::sprintf("%u.%u.%u.%u:%u", o[0], o[1], o[2], o[3], port());
}

bool inet4_address::operator==(inet4_address const& op) const
{
	return addr_.sin_port == op.addr_.sin_port && octets() == op.octets();
}

inet6_address::inet6_address()
{
	addr_.sin6_family = AF_INET6;
}

inet6_address::inet6_address(std::array<uint8_t, 16> const& octets, uint16_t port, uint32_t flowinfo, uint32_t scope_id)
{
	addr_.sin6_family = AF_INET6;
	addr_.sin6_port = htons(port);
	addr_.sin6_flowinfo = htonl(flowinfo);
	addr_.sin6_scope_id = scope_id;
	memcpy(&addr_.sin6_addr, octets.data(), octets.size());
}

inet6_address::inet6_address(sockaddr_in6 const& addr)
	: addr_(addr)
{
}

std::optional<inet6_address> inet6_address::parse(std::string_view s)
{
	std::string_view host;
	std::string_view port_part;
	if (!s.empty() && s[0] == '[') {
		auto pos = s.find("]:");
		if (pos == std::string_view::npos) {
			return {};
		}
		host = s.substr(1, pos - 1);
		port_part = s.substr(pos + 2);
	}
	else {
		auto pos = s.rfind(':');
		if (pos == std::string_view::npos) {
			return {};
		}
		host = s.substr(0, pos);
		port_part = s.substr(pos + 1);
	}

	uint16_t port{};
	if (!parse_port(port_part, port)) {
		return {};
	}

	inet6_address ret;
	std::string const h(host);
	if (inet_pton(AF_INET6, h.c_str(), &ret.addr_.sin6_addr) != 1) {
		return {};
	}
	ret.set_port(port);

	return ret;
}

uint16_t inet6_address::port() const
{
	return ntohs(addr_.sin6_port);
}

void inet6_address::set_port(uint16_t port)
{
	addr_.sin6_port = htons(port);
}

std::array<uint8_t, 16> inet6_address::octets() const
{
	std::array<uint8_t, 16> ret;
	memcpy(ret.data(), &addr_.sin6_addr, ret.size());
	return ret;
}

std::array<uint16_t, 8> inet6_address::segments() const
{
	auto const o = octets();
	std::array<uint16_t, 8> ret;
	for (size_t i = 0; i < ret.size(); ++i) {
		ret[i] = static_cast<uint16_t>((o[i * 2] << 8) | o[i * 2 + 1]);
	}
	return ret;
}

uint32_t inet6_address::flowinfo() const
{
	return ntohl(addr_.sin6_flowinfo);
}

uint32_t inet6_address::scope_id() const
{
	return addr_.sin6_scope_id;
}

bool inet6_address::is_unspecified() const
{
	return octets() == std::array<uint8_t, 16>{};
}

bool inet6_address::is_loopback() const
{
	return octets() == std::array<uint8_t, 16>{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
}

bool inet6_address::is_multicast() const
{
	return octets()[0] == 0xff;
}

std::optional<inet4_address> inet6_address::to_ipv4_mapped() const
{
	auto const o = octets();
	for (size_t i = 0; i < 10; ++i) {
		if (o[i]) {
			return {};
		}
	}
	if (o[10] != 0xff || o[11] != 0xff) {
		return {};
	}

	return inet4_address({o[12], o[13], o[14], o[15]}, port());
}

std::string inet6_address::to_string() const
{
	char buf[INET6_ADDRSTRLEN];
	if (!inet_ntop(AF_INET6, &addr_.sin6_addr, buf, sizeof(buf))) {
		return std::string();
	}
	return sfx::sprintf("[%s]:%u", buf, port());
}

bool inet6_address::operator==(inet6_address const& op) const
{
	return addr_.sin6_port == op.addr_.sin6_port && addr_.sin6_flowinfo == op.addr_.sin6_flowinfo &&
		addr_.sin6_scope_id == op.addr_.sin6_scope_id && octets() == op.octets();
}

unix_address::unix_address()
{
	addr_.sun_family = AF_UNIX;
}

unix_address::unix_address(sockaddr_un const& addr)
	: addr_(addr)
{
}

result unix_address::create(path_arg path, unix_address& out)
{
	return path.with_cstr([&](cstring_view p) -> result {
		// Room is needed for the terminating NUL
		if (p.size() >= sizeof(out.addr_.sun_path) - 1) {
			return {result::invalid, ENAMETOOLONG};
		}

		unix_address ret;
		memcpy(ret.addr_.sun_path, p.c_str(), p.size());
		out = ret;
		return {result::ok};
	});
}

#if SFX_LINUX
result unix_address::create_abstract(std::string_view name, unix_address& out)
{
	if (memchr(name.data(), 0, name.size())) {
		return {result::invalid, EINVAL};
	}
	if (name.size() >= sizeof(out.addr_.sun_path) - 2) {
		return {result::invalid, ENAMETOOLONG};
	}

	unix_address ret;
	memcpy(ret.addr_.sun_path + 1, name.data(), name.size());
	out = ret;
	return {result::ok};
}

std::optional<std::string_view> unix_address::abstract_name() const
{
	if (addr_.sun_path[0] || !addr_.sun_path[1]) {
		return {};
	}
	char const* name = addr_.sun_path + 1;
	return std::string_view(name, strnlen(name, sizeof(addr_.sun_path) - 1));
}
#endif

std::optional<std::string_view> unix_address::path() const
{
	if (!addr_.sun_path[0]) {
		return {};
	}
	return std::string_view(addr_.sun_path, strnlen(addr_.sun_path, sizeof(addr_.sun_path)));
}

bool unix_address::is_unnamed() const
{
	if (addr_.sun_path[0]) {
		return false;
	}
#if SFX_LINUX
	if (addr_.sun_path[1]) {
		return false;
	}
#endif
	return true;
}

socket_address::socket_address(inet4_address const& addr)
	: len_(sizeof(sockaddr_in))
{
	memcpy(&storage_, &addr.native(), sizeof(sockaddr_in));
}

socket_address::socket_address(inet6_address const& addr)
	: len_(sizeof(sockaddr_in6))
{
	memcpy(&storage_, &addr.native(), sizeof(sockaddr_in6));
}

socket_address::socket_address(unix_address const& addr)
	: len_(sizeof(sockaddr_un))
{
	memcpy(&storage_, &addr.native(), sizeof(sockaddr_un));
}

result socket_address::from_raw(sockaddr_storage const& storage, socklen_t len, socket_address& out)
{
	socklen_t const max = sizeof(sockaddr_storage);
	switch (storage.ss_family) {
	case AF_INET:
		if (len < sizeof(sockaddr_in)) {
			return {result::invalid, EINVAL};
		}
		break;
	case AF_INET6:
		if (len < sizeof(sockaddr_in6)) {
			return {result::invalid, EINVAL};
		}
		break;
	case AF_UNIX:
		if (len < offsetof(sockaddr_un, sun_path)) {
			return {result::invalid, EINVAL};
		}
		break;
	default:
		return {result::invalid, EINVAL};
	}

	out.storage_ = storage;
	out.len_ = len < max ? len : max;
	if (storage.ss_family == AF_UNIX) {
		// The system may report the unix address without the trailing part of sun_path
		auto& un = reinterpret_cast<sockaddr_un&>(out.storage_);
		size_t const used = out.len_ - offsetof(sockaddr_un, sun_path);
		if (used < sizeof(un.sun_path)) {
			memset(un.sun_path + used, 0, sizeof(un.sun_path) - used);
		}
	}
	return {result::ok};
}

std::optional<inet4_address> socket_address::inet4() const
{
	if (storage_.ss_family != AF_INET) {
		return {};
	}
	return inet4_address(reinterpret_cast<sockaddr_in const&>(storage_));
}

std::optional<inet6_address> socket_address::inet6() const
{
	if (storage_.ss_family != AF_INET6) {
		return {};
	}
	return inet6_address(reinterpret_cast<sockaddr_in6 const&>(storage_));
}

std::optional<unix_address> socket_address::unix_addr() const
{
	if (storage_.ss_family != AF_UNIX) {
		return {};
	}
	return unix_address(reinterpret_cast<sockaddr_un const&>(storage_));
}

std::optional<uint16_t> socket_address::port() const
{
	switch (storage_.ss_family) {
	case AF_INET:
		return inet4()->port();
	case AF_INET6:
		return inet6()->port();
	default:
		return {};
	}
}

std::string address_to_string(socket_address const& addr, bool with_port, bool strip_zone_index)
{
	if (addr.family() == AF_UNIX) {
		auto path = addr.unix_addr()->path();
		return path ? std::string(*path) : std::string();
	}

	char hostbuf[NI_MAXHOST];
	char portbuf[NI_MAXSERV];

	int res = getnameinfo(addr.native(), addr.size(), hostbuf, NI_MAXHOST, portbuf, NI_MAXSERV, NI_NUMERICHOST | NI_NUMERICSERV);
	if (res) {
		return std::string();
	}

	std::string host = hostbuf;
	std::string port = portbuf;

	// IPv6 uses colons as separator, need to enclose address
	// to avoid ambiguity if also showing port
	if (addr.family() == AF_INET6) {
		if (strip_zone_index) {
			auto pos = host.find('%');
			if (pos != std::string::npos) {
				host = host.substr(0, pos);
			}
		}
		if (with_port) {
			host = "[" + host + "]";
		}
	}

	if (with_port) {
		return host + ":" + port;
	}
	else {
		return host;
	}
}

result socket(file_desc& fd, int domain, int type, int protocol, bool cloexec)
{
	if (!cloexec) {
		int ret = ::socket(domain, type, protocol);
		if (ret == -1) {
			return result_from_errno(errno);
		}
		fd.reset(ret);
		return {result::ok};
	}

#if HAVE_SOCK_CLOEXEC
	int ret = ::socket(domain, type | SOCK_CLOEXEC, protocol);
	if (ret == -1) {
		return result_from_errno(errno);
	}
#else
	forkblock b;
	int ret = ::socket(domain, type, protocol);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	int const err = set_cloexec(ret);
	if (err) {
		::close(ret);
		return result_from_errno(err);
	}
#endif

	fd.reset(ret);
	return {result::ok};
}

result socketpair(file_desc& a, file_desc& b, int domain, int type, int protocol, bool cloexec)
{
	int fds[2];
	if (!cloexec) {
		if (::socketpair(domain, type, protocol, fds) != 0) {
			return result_from_errno(errno);
		}
	}
	else {
#if HAVE_SOCK_CLOEXEC
		if (::socketpair(domain, type | SOCK_CLOEXEC, protocol, fds) != 0) {
			return result_from_errno(errno);
		}
#else
		forkblock fb;
		if (::socketpair(domain, type, protocol, fds) != 0) {
			return result_from_errno(errno);
		}
		int err = set_cloexec(fds[0]);
		if (!err) {
			err = set_cloexec(fds[1]);
		}
		if (err) {
			::close(fds[0]);
			::close(fds[1]);
			return result_from_errno(err);
		}
#endif
	}

	a.reset(fds[0]);
	b.reset(fds[1]);
	return {result::ok};
}

result bind(int fd, socket_address const& addr)
{
	return check(::bind(fd, addr.native(), addr.size()));
}

result listen(int fd, int backlog)
{
	return check(::listen(fd, backlog));
}

result accept(int fd, file_desc& out, socket_address* peer, bool cloexec)
{
	sockaddr_u addr{};
	socklen_t addr_len = sizeof(addr);

	int ret = -1;
	if (!cloexec) {
		ret = ::accept(fd, &addr.sockaddr_, &addr_len);
		if (ret == -1) {
			return result_from_errno(errno);
		}
	}
	else {
#if HAVE_ACCEPT4
		ret = ::accept4(fd, &addr.sockaddr_, &addr_len, SOCK_CLOEXEC);
		if (ret == -1 && errno != ENOSYS) {
			return result_from_errno(errno);
		}
		if (ret == -1)
#endif
		{
			forkblock b;
			addr_len = sizeof(addr);
			ret = ::accept(fd, &addr.sockaddr_, &addr_len);
			if (ret == -1) {
				return result_from_errno(errno);
			}
			int const err = set_cloexec(ret);
			if (err) {
				::close(ret);
				return result_from_errno(err);
			}
		}
	}

	out.reset(ret);
	if (peer) {
		// Peers of unix sockets are usually unnamed, but the family is always set
		if (!socket_address::from_raw(addr.storage, addr_len, *peer)) {
			*peer = socket_address();
		}
	}
	return {result::ok};
}

result connect(int fd, socket_address const& addr)
{
	return check(::connect(fd, addr.native(), addr.size()));
}

namespace {
template<typename F>
result get_address(F && f, socket_address& out)
{
	sockaddr_u addr{};
	socklen_t addr_len = sizeof(addr);
	if (f(&addr.sockaddr_, &addr_len) != 0) {
		return result_from_errno(errno);
	}
	return socket_address::from_raw(addr.storage, addr_len, out);
}
}

result getsockname(int fd, socket_address& out)
{
	return get_address([fd](sockaddr* addr, socklen_t* len) { return ::getsockname(fd, addr, len); }, out);
}

result getpeername(int fd, socket_address& out)
{
	return get_address([fd](sockaddr* addr, socklen_t* len) { return ::getpeername(fd, addr, len); }, out);
}

result shutdown(int fd, shutdown_how how)
{
	return check(::shutdown(fd, static_cast<int>(how)));
}

rwresult send(int fd, void const* buf, size_t len, msg_flag flags)
{
	return check_size(::send(fd, buf, len, static_cast<int>(flags)));
}

rwresult recv(int fd, void* buf, size_t len, msg_flag flags)
{
	return check_size(::recv(fd, buf, len, static_cast<int>(flags)));
}

rwresult sendto(int fd, void const* buf, size_t len, msg_flag flags, socket_address const& to)
{
	return check_size(::sendto(fd, buf, len, static_cast<int>(flags), to.native(), to.size()));
}

rwresult recvfrom(int fd, void* buf, size_t len, msg_flag flags, socket_address* from)
{
	sockaddr_u addr{};
	socklen_t addr_len = sizeof(addr);
	auto r = check_size(::recvfrom(fd, buf, len, static_cast<int>(flags), &addr.sockaddr_, &addr_len));
	if (r && from) {
		// Connected sockets may not report a sender
		if (!addr_len || !socket_address::from_raw(addr.storage, addr_len, *from)) {
			*from = socket_address();
		}
	}
	return r;
}

result get_option(int fd, int level, int name, int& value)
{
	int v{};
	socklen_t len = sizeof(v);
	if (::getsockopt(fd, level, name, &v, &len) != 0) {
		return result_from_errno(errno);
	}
	value = v;
	return {result::ok};
}

result set_option(int fd, int level, int name, int value)
{
	return check(::setsockopt(fd, level, name, &value, sizeof(value)));
}

}
