#ifndef LIBSAFIX_SOCKET_HEADER
#define LIBSAFIX_SOCKET_HEADER

#include "file_desc.hpp"
#include "path.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include <netinet/in.h>
#include <stdint.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>

/** \file
 * \brief Socket addresses and the BSD socket calls
 *
 * The functions in here are synchronous wrappers of single system calls.
 * Use \ref set_nonblocking together with \ref poll for non-blocking operation.
 */

namespace sfx {

/// An IPv4 address and port, wraps sockaddr_in
class SFX_PUBLIC_SYMBOL inet4_address final
{
public:
	/// 0.0.0.0:0
	inet4_address();
	inet4_address(std::array<uint8_t, 4> const& octets, uint16_t port);
	explicit inet4_address(sockaddr_in const& addr);

	/// Parses "a.b.c.d:port". Returns nullopt on malformed input.
	static std::optional<inet4_address> parse(std::string_view s);

	/// Port in host byte order
	uint16_t port() const;
	void set_port(uint16_t port);

	std::array<uint8_t, 4> octets() const;

	/// 0.0.0.0
	bool is_unspecified() const;

	/// 127.0.0.0/8
	bool is_loopback() const;

	/// 10.0.0.0/8, 172.16.0.0/12 and 192.168.0.0/16
	bool is_private() const;

	/// 169.254.0.0/16
	bool is_link_local() const;

	/// 255.255.255.255
	bool is_broadcast() const;

	/// "a.b.c.d:port"
	std::string to_string() const;

	sockaddr_in const& native() const { return addr_; }

	bool operator==(inet4_address const& op) const;
	bool operator!=(inet4_address const& op) const { return !(*this == op); }

private:
	sockaddr_in addr_{};
};

/// An IPv6 address and port, wraps sockaddr_in6
class SFX_PUBLIC_SYMBOL inet6_address final
{
public:
	/// [::]:0
	inet6_address();
	inet6_address(std::array<uint8_t, 16> const& octets, uint16_t port, uint32_t flowinfo = 0, uint32_t scope_id = 0);
	explicit inet6_address(sockaddr_in6 const& addr);

	/** \brief Parses an address with port
	 *
	 * Accepts "[addr]:port" and, as long as it is unambiguous, "addr:port" with
	 * the port following the last colon.
	 */
	static std::optional<inet6_address> parse(std::string_view s);

	uint16_t port() const;
	void set_port(uint16_t port);

	std::array<uint8_t, 16> octets() const;

	/// The address as eight 16-bit groups in host byte order
	std::array<uint16_t, 8> segments() const;

	uint32_t flowinfo() const;
	uint32_t scope_id() const;

	/// ::
	bool is_unspecified() const;

	/// ::1
	bool is_loopback() const;

	/// ff00::/8
	bool is_multicast() const;

	/// For addresses of the form ::ffff:a.b.c.d, returns a.b.c.d with the same port
	std::optional<inet4_address> to_ipv4_mapped() const;

	/// "[addr]:port"
	std::string to_string() const;

	sockaddr_in6 const& native() const { return addr_; }

	bool operator==(inet6_address const& op) const;
	bool operator!=(inet6_address const& op) const { return !(*this == op); }

private:
	sockaddr_in6 addr_{};
};

/** \brief A unix domain socket address, wraps sockaddr_un
 *
 * An address either names a path, an abstract name (Linux only) or nothing at all.
 */
class SFX_PUBLIC_SYMBOL unix_address final
{
public:
	/// Creates an unnamed address
	unix_address();
	explicit unix_address(sockaddr_un const& addr);

	/** \brief Creates an address for the given path.
	 *
	 * Fails with EINVAL if the path contains a NUL byte and with ENAMETOOLONG if
	 * it does not fit into sun_path.
	 */
	static result create(path_arg path, unix_address& out);

#if SFX_LINUX
	/// Creates an address in the abstract namespace
	static result create_abstract(std::string_view name, unix_address& out);
#endif

	/// The path, nullopt for abstract and unnamed addresses
	std::optional<std::string_view> path() const;

#if SFX_LINUX
	/// The name in the abstract namespace, nullopt for path and unnamed addresses
	std::optional<std::string_view> abstract_name() const;
#endif

	bool is_unnamed() const;

	sockaddr_un const& native() const { return addr_; }

private:
	sockaddr_un addr_{};
};

/** \brief Holds any of the supported socket addresses
 *
 * Returned by \ref accept, \ref getsockname and friends, passed to \ref bind and \ref connect.
 */
class SFX_PUBLIC_SYMBOL socket_address final
{
public:
	/// An empty address with family AF_UNSPEC
	socket_address() = default;

	socket_address(inet4_address const& addr);
	socket_address(inet6_address const& addr);
	socket_address(unix_address const& addr);

	/** \brief Creates the address from storage filled in by the system
	 *
	 * Fails with EINVAL if the family is not supported or \c len is too short for it.
	 */
	static result from_raw(sockaddr_storage const& storage, socklen_t len, socket_address& out);

	/// AF_INET, AF_INET6, AF_UNIX or AF_UNSPEC
	int family() const { return storage_.ss_family; }

	std::optional<inet4_address> inet4() const;
	std::optional<inet6_address> inet6() const;
	std::optional<unix_address> unix_addr() const;

	/// The port of IP addresses
	std::optional<uint16_t> port() const;

	sockaddr const* native() const { return reinterpret_cast<sockaddr const*>(&storage_); }
	socklen_t size() const { return len_; }

private:
	sockaddr_storage storage_{};
	socklen_t len_{};
};

/** \brief Formats the numeric host of an IP address using getnameinfo
 *
 * If with_port is set, the port is appended and IPv6 addresses get enclosed in brackets.
 * Unix domain addresses are returned as their path. Returns an empty string on failure.
 */
std::string SFX_PUBLIC_SYMBOL address_to_string(socket_address const& addr, bool with_port = true, bool strip_zone_index = false);

/// Flags for \ref send, \ref recv and their variants
enum class msg_flag : int
{
	none = 0,
	oob = MSG_OOB,
	peek = MSG_PEEK,
	dontroute = MSG_DONTROUTE,
	dontwait = MSG_DONTWAIT,
	waitall = MSG_WAITALL,
	trunc = MSG_TRUNC,
#ifdef MSG_NOSIGNAL
	nosignal = MSG_NOSIGNAL,
#endif
};
SFX_ENUM_FLAG_OPERATORS(msg_flag)

enum class shutdown_how : int
{
	read = SHUT_RD,
	write = SHUT_WR,
	both = SHUT_RDWR
};

/// Creates a socket. Unless cloexec is false, FD_CLOEXEC is set without racing concurrent spawns.
result SFX_PUBLIC_SYMBOL socket(file_desc& fd, int domain, int type, int protocol = 0, bool cloexec = true);

/// Creates a pair of connected sockets
result SFX_PUBLIC_SYMBOL socketpair(file_desc& a, file_desc& b, int domain, int type, int protocol = 0, bool cloexec = true);

result SFX_PUBLIC_SYMBOL bind(int fd, socket_address const& addr);
result SFX_PUBLIC_SYMBOL listen(int fd, int backlog);

/** \brief Accepts a connection.
 *
 * On success \c out owns the new socket. If peer is not null, it receives the address of the peer.
 */
result SFX_PUBLIC_SYMBOL accept(int fd, file_desc& out, socket_address* peer = nullptr, bool cloexec = true);

result SFX_PUBLIC_SYMBOL connect(int fd, socket_address const& addr);

result SFX_PUBLIC_SYMBOL getsockname(int fd, socket_address& out);
result SFX_PUBLIC_SYMBOL getpeername(int fd, socket_address& out);

result SFX_PUBLIC_SYMBOL shutdown(int fd, shutdown_how how);

rwresult SFX_PUBLIC_SYMBOL send(int fd, void const* buf, size_t len, msg_flag flags = msg_flag::none);
rwresult SFX_PUBLIC_SYMBOL recv(int fd, void* buf, size_t len, msg_flag flags = msg_flag::none);

rwresult SFX_PUBLIC_SYMBOL sendto(int fd, void const* buf, size_t len, msg_flag flags, socket_address const& to);

/// If from is not null, it receives the address of the sender.
rwresult SFX_PUBLIC_SYMBOL recvfrom(int fd, void* buf, size_t len, msg_flag flags, socket_address* from);

/// Gets an integer socket option, e.g. SOL_SOCKET, SO_TYPE
result SFX_PUBLIC_SYMBOL get_option(int fd, int level, int name, int& value);
result SFX_PUBLIC_SYMBOL set_option(int fd, int level, int name, int value);

}

#endif
