#include "syscall.hpp"
#include "libsafix/stdlib.hpp"

#include <vector>

#include <limits.h>
#include <stdlib.h>
#include <string.h>

#if HAVE_GETRANDOM
#include <sys/random.h>
#elif HAVE_GETENTROPY && SFX_MAC
#include <sys/random.h>
#endif

namespace sfx {

namespace {
mutex& env_mutex()
{
	static mutex m;
	return m;
}
}

result realpath(path_arg path, std::string& out)
{
	return path.with_cstr([&](cstring_view p) -> result {
		char* resolved = ::realpath(p.c_str(), nullptr);
		if (!resolved) {
			return result_from_errno(errno);
		}

		out = resolved;
		free(resolved);
		return {result::ok};
	});
}

result getrandom([[maybe_unused]] void* buf, [[maybe_unused]] size_t len, [[maybe_unused]] random_flag flags, [[maybe_unused]] size_t& written)
{
#if HAVE_GETRANDOM
	unsigned int f{};
	if (flags & random_flag::nonblock) {
		f |= GRND_NONBLOCK;
	}
	if (flags & random_flag::random) {
		f |= GRND_RANDOM;
	}

	ssize_t ret = ::getrandom(buf, len, f);
	if (ret == -1) {
		return result_from_errno(errno);
	}
	written = static_cast<size_t>(ret);
	return {result::ok};
#else
	return {result::other, ENOSYS};
#endif
}

result getentropy([[maybe_unused]] void* buf, [[maybe_unused]] size_t len)
{
#if HAVE_GETENTROPY
	return check(::getentropy(buf, len));
#else
	return {result::other, ENOSYS};
#endif
}

result posix_openpt(file_desc& master, oflag flags)
{
	int ret = ::posix_openpt(static_cast<int>(flags));
	if (ret == -1) {
		return result_from_errno(errno);
	}

	master.reset(ret);
	return {result::ok};
}

result grantpt(int master)
{
	return check(::grantpt(master));
}

result unlockpt(int master)
{
	return check(::unlockpt(master));
}

result ptsname(int master, std::string& out)
{
#if HAVE_PTSNAME_R
	std::vector<char> buf(64);
	while (true) {
		int res = ::ptsname_r(master, buf.data(), buf.size());
		if (!res) {
			break;
		}
		// Some implementations return -1 and set errno instead
		if (res == -1) {
			res = errno;
		}
		if (res != ERANGE || buf.size() >= PATH_MAX) {
			return result_from_errno(res);
		}
		buf.resize(buf.size() * 2);
	}
	out = buf.data();
	return {result::ok};
#else
	// ptsname uses a static buffer
	static mutex m;
	scoped_lock l(m);

	char const* name = ::ptsname(master);
	if (!name) {
		return result_from_errno(errno);
	}
	out = name;
	return {result::ok};
#endif
}

result getenv(path_arg name, std::optional<std::string>& value)
{
	return name.with_cstr([&](cstring_view n) -> result {
		scoped_lock l(env_mutex());

		char const* v = ::getenv(n.c_str());
		if (v) {
			value = std::string(v);
		}
		else {
			value.reset();
		}
		return {result::ok};
	});
}

result setenv(path_arg name, path_arg value, bool overwrite)
{
	return name.with_cstr([&](cstring_view n) {
		return value.with_cstr([&](cstring_view v) {
			scoped_lock l(env_mutex());
			return check(::setenv(n.c_str(), v.c_str(), overwrite ? 1 : 0));
		});
	});
}

result unsetenv(path_arg name)
{
	return name.with_cstr([&](cstring_view n) {
		scoped_lock l(env_mutex());
		return check(::unsetenv(n.c_str()));
	});
}

}
