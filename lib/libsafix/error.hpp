#ifndef LIBSAFIX_ERROR_HEADER
#define LIBSAFIX_ERROR_HEADER

#include "libsafix.hpp"

#include <string>

#include <errno.h>
#include <stdint.h>
#include <stddef.h>

/** \file
 * \brief Result types returned by all system call wrappers and errno helpers.
 */

namespace sfx {

/**
 * \brief Small class to return system call errors
 *
 * Note that not all system errors are recognized in all situations,
 * "other" is always a possible error value even if another category
 * would fit better. The raw error code in \c raw_ is always the exact
 * value of errno, or of the error number returned by the failing call.
 */
class SFX_PUBLIC_SYMBOL result
{
public:
	enum error {
		ok,
		none = ok,

		/// Invalid arguments, syntax error
		invalid,

		/// Permission denied
		noperm,

		/// Requested file does not exist or is not a file
		nofile,

		/// Requested dir does not exist or is not a dir
		nodir,

		/// The target already exists
		exists,

		/// Out of disk space
		nospace,

		/// The operation would have blocked, but the file descriptor is marked non-blocking
		wouldblock,

		/// The call was interrupted by a signal before it could complete
		interrupted,

		/// Some other error
		other
	};

	typedef int raw_t;

	explicit operator bool() const { return error_ == 0; }

	error error_{};

	raw_t raw_{};
};

class SFX_PUBLIC_SYMBOL rwresult final
{
public:
	typedef int raw_t;

	enum error {
		none,

		/// Invalid arguments, syntax error
		invalid,

		/// Out of disk space
		nospace,

		/// The operation would have blocked, but the file descriptor is marked non-blocking
		wouldblock,

		/// The call was interrupted by a signal before any data was transferred
		interrupted,

		/// Some other error
		other
	};

	explicit rwresult(error e, raw_t raw)
	    : error_(e)
	    , raw_(raw)
	    , value_(-1)
	{}

	explicit rwresult(size_t value)
	    : value_(value)
	{}

	explicit operator bool() const { return error_ == 0; }

	error error_{};

	/// Undefined if error_ is none
	raw_t raw_{};

	/// Undefined if error_ is not none
	size_t value_{};
};

/// Maps an errno value to a \ref result. Passing 0 yields success.
result SFX_PUBLIC_SYMBOL result_from_errno(int raw);

/// Maps an errno value to a \ref rwresult carrying the error.
rwresult SFX_PUBLIC_SYMBOL rwresult_from_errno(int raw);

/// Shorthand for a failed \ref result with the given errno value
inline result error_result(int raw) {
	return result_from_errno(raw);
}

/** \brief Returns the calling thread's errno.
 *
 * errno is thread-local. Read it immediately after the call that failed,
 * any intervening library call may overwrite it.
 */
int SFX_PUBLIC_SYMBOL get_errno();

/// Sets the calling thread's errno
void SFX_PUBLIC_SYMBOL set_errno(int value);

/** \brief Gets the symbolic name of an errno value
 *
 * For example, <tt>error_name(EAGAIN) == "EAGAIN"</tt>. Returns an
 * empty string for unknown values.
 */
std::string SFX_PUBLIC_SYMBOL error_name(int raw);

/** \brief Gets the human readable description of an errno value
 *
 * Returns "Success" for 0 and "Unknown error" for negative values or values
 * the C library does not know.
 */
std::string SFX_PUBLIC_SYMBOL error_description(int raw);

/// Formats the result as "description (code N)"
std::string SFX_PUBLIC_SYMBOL to_string(result const& r);

/// \overload
std::string SFX_PUBLIC_SYMBOL to_string(rwresult const& r);

/// \private
template<typename R>
R invalid_argument();

/// \private
template<>
inline result invalid_argument<result>() {
	return {result::invalid, EINVAL};
}

/// \private
template<>
inline rwresult invalid_argument<rwresult>() {
	return rwresult{rwresult::invalid, EINVAL};
}

}

#endif
