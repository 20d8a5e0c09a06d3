#include "syscall.hpp"
#include "libsafix/statfs.hpp"

namespace sfx {

result statfs(path_arg path, statfs_info& out)
{
	return path.with_cstr([&](cstring_view p) {
		return check(::statfs(p.c_str(), &out.native()));
	});
}

result fstatfs(int fd, statfs_info& out)
{
	return check(::fstatfs(fd, &out.native()));
}

}
