#include "syscall.hpp"
#include "libsafix/grp.hpp"

#include <grp.h>

namespace sfx {

namespace {
template<typename Lookup>
result do_get_group(Lookup && lookup, std::optional<group>& out)
{
	std::vector<char> buf;
	struct ::group g{};
	struct ::group* pg{};

	size_t s = lookup_buffer_size(_SC_GETGR_R_SIZE_MAX);
	int res{};
	while (true) {
		buf.resize(s);
		res = lookup(&g, buf.data(), buf.size(), &pg);
		if (res != ERANGE || s >= max_lookup_buffer_size) {
			break;
		}
		s *= 2;
	}

	if (!pg) {
		if (is_not_found(res)) {
			out.reset();
			return {result::ok};
		}
		return result_from_errno(res);
	}

	group ret;
	ret.name = pg->gr_name ? pg->gr_name : "";
	ret.password = pg->gr_passwd ? pg->gr_passwd : "";
	ret.gid = pg->gr_gid;
	if (pg->gr_mem) {
		for (char** m = pg->gr_mem; *m; ++m) {
			ret.members.emplace_back(*m);
		}
	}
	out = std::move(ret);

	return {result::ok};
}
}

result get_group(gid_t gid, std::optional<group>& out)
{
	return do_get_group([gid](struct ::group* g, char* buf, size_t size, struct ::group** pg) {
		return ::getgrgid_r(gid, g, buf, size, pg);
	}, out);
}

result get_group(path_arg name, std::optional<group>& out)
{
	return name.with_cstr([&](cstring_view n) {
		return do_get_group([&n](struct ::group* g, char* buf, size_t size, struct ::group** pg) {
			return ::getgrnam_r(n.c_str(), g, buf, size, pg);
		}, out);
	});
}

result get_group_list([[maybe_unused]] path_arg user, [[maybe_unused]] gid_t gid, [[maybe_unused]] std::vector<gid_t>& groups)
{
#if HAVE_GETGROUPLIST
	return user.with_cstr([&](cstring_view u) -> result {
#if SFX_MAC
		typedef int glt;
		static_assert(sizeof(gid_t) == sizeof(glt));
#else
		typedef gid_t glt;
#endif

		int size = 32;
		while (true) {
			groups.resize(static_cast<size_t>(size));
			int const capacity = size;
			int res = ::getgrouplist(u.c_str(), static_cast<glt>(gid), reinterpret_cast<glt*>(groups.data()), &size);
			if (res >= 0) {
				groups.resize(static_cast<size_t>(size));
				return {result::ok};
			}
			if (size < 0 || capacity >= (1 << 16)) {
				groups.clear();
				return {result::other, ERANGE};
			}

			// Not every implementation reports the required size
			if (size <= capacity) {
				size = capacity * 2;
			}
		}
	});
#else
	return {result::other, ENOSYS};
#endif
}

}
