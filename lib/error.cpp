#include "syscall.hpp"
#include "libsafix/format.hpp"

#include <cstdlib>
#include <iostream>
#include <unordered_map>

#include <errno.h>
#include <string.h>

namespace sfx {

result result_from_errno(int raw)
{
	switch (raw) {
	case 0:
		return {result::ok};
	case EINVAL:
	case ENAMETOOLONG:
	case ELOOP:
	case EBADF:
		return {result::invalid, raw};
	case EACCES:
	case EPERM:
	case EROFS:
		return {result::noperm, raw};
	case EISDIR:
		return {result::nofile, raw};
	case ENOENT:
	case ENOTDIR:
		return {result::nodir, raw};
	case EEXIST:
	case ENOTEMPTY:
		return {result::exists, raw};
	case ENOSPC:
	case EDQUOT:
		return {result::nospace, raw};
	case EAGAIN:
#if EWOULDBLOCK != EAGAIN
	case EWOULDBLOCK:
#endif
		return {result::wouldblock, raw};
	case EINTR:
		return {result::interrupted, raw};
	default:
		return {result::other, raw};
	}
}

rwresult rwresult_from_errno(int raw)
{
	switch (raw) {
	case EINVAL:
	case EBADF:
	case EFAULT:
		return rwresult{rwresult::invalid, raw};
	case ENOSPC:
	case EDQUOT:
		return rwresult{rwresult::nospace, raw};
	case EAGAIN:
#if EWOULDBLOCK != EAGAIN
	case EWOULDBLOCK:
#endif
		return rwresult{rwresult::wouldblock, raw};
	case EINTR:
		return rwresult{rwresult::interrupted, raw};
	default:
		return rwresult{rwresult::other, raw};
	}
}

int get_errno()
{
	return errno;
}

void set_errno(int value)
{
	errno = value;
}

namespace {
std::unordered_map<int, std::string> const& get_names()
{
	static std::unordered_map<int, std::string> const names = [](){
		std::unordered_map<int, std::string> ret;

		// Aliases like EWOULDBLOCK share a value, the first name inserted wins
		auto sorted_insert = [&ret](int code, std::string const& name)
		{
			auto it = ret.find(code);
			if (it == ret.cend()) {
				ret[code] = name;
			}
		};
		#define insert(c) sorted_insert(c, #c)

		insert(EPERM);
		insert(ENOENT);
		insert(ESRCH);
		insert(EINTR);
		insert(EIO);
		insert(ENXIO);
		insert(E2BIG);
		insert(ENOEXEC);
		insert(EBADF);
		insert(ECHILD);
		insert(EAGAIN);
		insert(EWOULDBLOCK);
		insert(ENOMEM);
		insert(EACCES);
		insert(EFAULT);
		insert(EBUSY);
		insert(EEXIST);
		insert(EXDEV);
		insert(ENODEV);
		insert(ENOTDIR);
		insert(EISDIR);
		insert(EINVAL);
		insert(ENFILE);
		insert(EMFILE);
		insert(ENOTTY);
		insert(ETXTBSY);
		insert(EFBIG);
		insert(ENOSPC);
		insert(ESPIPE);
		insert(EROFS);
		insert(EMLINK);
		insert(EPIPE);
		insert(EDOM);
		insert(ERANGE);
		insert(EDEADLK);
		insert(ENAMETOOLONG);
		insert(ENOLCK);
		insert(ENOSYS);
		insert(ENOTEMPTY);
		insert(ELOOP);
		insert(ENOMSG);
		insert(EIDRM);
#ifdef ENOSTR
		insert(ENOSTR);
#endif
#ifdef ENODATA
		insert(ENODATA);
#endif
#ifdef ETIME
		insert(ETIME);
#endif
#ifdef ENOSR
		insert(ENOSR);
#endif
		insert(ENOLINK);
		insert(EPROTO);
		insert(EMULTIHOP);
		insert(EBADMSG);
		insert(EOVERFLOW);
		insert(EILSEQ);
		insert(ENOTSOCK);
		insert(EDESTADDRREQ);
		insert(EMSGSIZE);
		insert(EPROTOTYPE);
		insert(ENOPROTOOPT);
		insert(EPROTONOSUPPORT);
		insert(EOPNOTSUPP);
		insert(ENOTSUP);
		insert(EAFNOSUPPORT);
		insert(EADDRINUSE);
		insert(EADDRNOTAVAIL);
		insert(ENETDOWN);
		insert(ENETUNREACH);
		insert(ENETRESET);
		insert(ECONNABORTED);
		insert(ECONNRESET);
		insert(ENOBUFS);
		insert(EISCONN);
		insert(ENOTCONN);
		insert(ETIMEDOUT);
		insert(ECONNREFUSED);
		insert(EHOSTUNREACH);
		insert(EALREADY);
		insert(EINPROGRESS);
		insert(ESTALE);
		insert(EDQUOT);
		insert(ECANCELED);
		insert(EOWNERDEAD);
		insert(ENOTRECOVERABLE);
#ifdef ENOTBLK
		insert(ENOTBLK);
#endif
#ifdef ESHUTDOWN
		insert(ESHUTDOWN);
#endif
#ifdef ETOOMANYREFS
		insert(ETOOMANYREFS);
#endif
#ifdef EHOSTDOWN
		insert(EHOSTDOWN);
#endif
#ifdef EUSERS
		insert(EUSERS);
#endif
#ifdef ESOCKTNOSUPPORT
		insert(ESOCKTNOSUPPORT);
#endif
#ifdef EPFNOSUPPORT
		insert(EPFNOSUPPORT);
#endif
#ifdef EREMOTE
		insert(EREMOTE);
#endif
#ifdef ENOMEDIUM
		insert(ENOMEDIUM);
#endif
#ifdef EMEDIUMTYPE
		insert(EMEDIUMTYPE);
#endif
#ifdef ENOKEY
		insert(ENOKEY);
#endif
#ifdef EKEYEXPIRED
		insert(EKEYEXPIRED);
#endif
#ifdef EKEYREVOKED
		insert(EKEYREVOKED);
#endif
#ifdef EKEYREJECTED
		insert(EKEYREJECTED);
#endif
#ifdef ERFKILL
		insert(ERFKILL);
#endif
#ifdef EHWPOISON
		insert(EHWPOISON);
#endif
#ifdef EAUTH
		insert(EAUTH);
#endif
#ifdef ENEEDAUTH
		insert(ENEEDAUTH);
#endif
#ifdef EFTYPE
		insert(EFTYPE);
#endif
#ifdef ENOATTR
		insert(ENOATTR);
#endif

		#undef insert
		return ret;
	}();

	return names;
}

// strerror_r comes in two flavours. GNU returns the message, XSI fills the
// buffer and returns an error code.
char const* strerror_message(char const* ret, char const*)
{
	return ret;
}

char const* strerror_message(int ret, char const* buf)
{
	return ret ? nullptr : buf;
}
}

std::string error_name(int raw)
{
	auto const& names = get_names();
	auto const it = names.find(raw);
	if (it != names.end()) {
		return it->second;
	}
	return std::string();
}

std::string error_description(int raw)
{
	if (!raw) {
		return "Success";
	}
	if (raw < 0) {
		return "Unknown error";
	}

	char buf[256];
	buf[0] = 0;
	char const* msg = strerror_message(strerror_r(raw, buf, sizeof(buf)), buf);
	if (!msg || !*msg) {
		return "Unknown error";
	}

	std::string ret = msg;
	if (!ret.compare(0, 13, "Unknown error") || ret == "No error information") {
		return "Unknown error";
	}
	return ret;
}

std::string to_string(result const& r)
{
	return sprintf("%s (code %d)", error_description(r.raw_), r.raw_);
}

std::string to_string(rwresult const& r)
{
	if (r) {
		return error_description(0) + " (code 0)";
	}
	return sprintf("%s (code %d)", error_description(r.raw_), r.raw_);
}

void check_or_abort(char const* op, int ret)
{
	if (ret) {
		std::cerr << sprintf("sfx: %s failed: %s\n", op, to_string(result_from_errno(ret)));
		std::abort();
	}
}

}
