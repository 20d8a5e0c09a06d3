#include "syscall.hpp"
#include "libsafix/pwd.hpp"

#include <vector>

#include <pwd.h>

namespace sfx {

namespace {
template<typename Lookup>
result do_get_passwd(Lookup && lookup, std::optional<passwd>& out)
{
	std::vector<char> buf;
	struct ::passwd pwd{};
	struct ::passwd* ppwd{};

	size_t s = lookup_buffer_size(_SC_GETPW_R_SIZE_MAX);
	int res{};
	while (true) {
		buf.resize(s);
		res = lookup(&pwd, buf.data(), buf.size(), &ppwd);
		if (res != ERANGE || s >= max_lookup_buffer_size) {
			break;
		}
		s *= 2;
	}

	if (!ppwd) {
		if (is_not_found(res)) {
			out.reset();
			return {result::ok};
		}
		return result_from_errno(res);
	}

	passwd ret;
	ret.name = ppwd->pw_name ? ppwd->pw_name : "";
	ret.password = ppwd->pw_passwd ? ppwd->pw_passwd : "";
	ret.gecos = ppwd->pw_gecos ? ppwd->pw_gecos : "";
	ret.dir = ppwd->pw_dir ? ppwd->pw_dir : "";
	ret.shell = ppwd->pw_shell ? ppwd->pw_shell : "";
	ret.uid = ppwd->pw_uid;
	ret.gid = ppwd->pw_gid;
	out = std::move(ret);

	return {result::ok};
}
}

result get_passwd(uid_t uid, std::optional<passwd>& out)
{
	return do_get_passwd([uid](struct ::passwd* pwd, char* buf, size_t size, struct ::passwd** ppwd) {
		return ::getpwuid_r(uid, pwd, buf, size, ppwd);
	}, out);
}

result get_passwd(path_arg name, std::optional<passwd>& out)
{
	return name.with_cstr([&](cstring_view n) {
		return do_get_passwd([&n](struct ::passwd* pwd, char* buf, size_t size, struct ::passwd** ppwd) {
			return ::getpwnam_r(n.c_str(), pwd, buf, size, ppwd);
		}, out);
	});
}

}
