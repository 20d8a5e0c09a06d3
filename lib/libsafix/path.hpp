#ifndef LIBSAFIX_PATH_HEADER
#define LIBSAFIX_PATH_HEADER

#include "cstring.hpp"
#include "error.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <string.h>

/** \file
 * \brief \ref sfx::path_arg, the argument type for paths and other strings passed to system calls.
 */

namespace sfx {

/** \brief Any stringy value that can be handed to a system call as a C string.
 *
 * Constructible from <tt>char const*</tt>, std::string, std::string_view,
 * \ref cstring and \ref cstring_view. It is a borrowed view: it must not
 * outlive the value it was created from, so only use it as a function parameter.
 *
 * Values that already carry a terminating NUL are passed through without copying.
 * Everything else is copied into a temporary \ref cstring for the duration of
 * \ref with_cstr.
 */
class path_arg final
{
public:
	path_arg(char const* s)
		: bytes_(s)
		, terminated_(true)
	{}

	path_arg(std::string const& s)
		: bytes_(s)
		, terminated_(true)
	{}

	path_arg(std::string_view s)
		: bytes_(s)
	{}

	path_arg(cstring const& s)
		: bytes_(s.bytes())
		, terminated_(true)
	{}

	path_arg(cstring_view const& s)
		: bytes_(s.bytes())
		, terminated_(true)
	{}

	/// Borrows the raw bytes. Never allocates.
	std::string_view bytes() const { return bytes_; }

	/** \brief Calls f with the value as a NUL-terminated string
	 *
	 * \c f must take a \ref cstring_view and return \ref result or \ref rwresult.
	 * It is called at most once and the view is only valid during the call.
	 *
	 * If the value contains a NUL byte, \c f is not called and an EINVAL error
	 * is returned instead.
	 */
	template<typename F>
	auto with_cstr(F && f) const -> std::decay_t<decltype(f(std::declval<cstring_view>()))>
	{
		typedef std::decay_t<decltype(f(std::declval<cstring_view>()))> ret_t;

		if (memchr(bytes_.data(), 0, bytes_.size())) {
			return invalid_argument<ret_t>();
		}

		if (terminated_) {
			// Terminator sits right behind the viewed bytes
			return std::forward<F>(f)(cstring_view(bytes_.data()));
		}

		auto s = cstring::create(std::string(bytes_));
		if (!s) {
			return invalid_argument<ret_t>();
		}
		return std::forward<F>(f)(s->as_view());
	}

private:
	std::string_view bytes_;
	bool terminated_{};
};

}

#endif
