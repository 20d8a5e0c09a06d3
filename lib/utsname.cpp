#include "syscall.hpp"
#include "libsafix/utsname.hpp"

#include <string.h>
#include <sys/utsname.h>

namespace sfx {

namespace {
template<size_t N>
std::string field(char const (&f)[N])
{
	return std::string(f, strnlen(f, N));
}
}

result uname(utsname_info& out)
{
	struct utsname u{};
	if (::uname(&u) == -1) {
		return result_from_errno(errno);
	}

	out.sysname = field(u.sysname);
	out.nodename = field(u.nodename);
	out.release = field(u.release);
	out.version = field(u.version);
	out.machine = field(u.machine);
	return {result::ok};
}

}
