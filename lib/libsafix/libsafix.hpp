#ifndef LIBSAFIX_LIBSAFIX_HEADER
#define LIBSAFIX_LIBSAFIX_HEADER

/** \file
 * \brief Sets some global macros and includes some commonly needed headers
 */

#include "private/defs.hpp"
#include "private/visibility.hpp"

#include <type_traits>

/** \mainpage
 *
 * \section intro Introduction
 *
 * libsafix wraps POSIX system calls in a thin, checked C++ layer.
 * Every wrapper maps onto one documented syscall or libc function,
 * translates the failure convention of that call into an \ref sfx::result
 * and converts strings and structures in both directions.
 *
 * String arguments are accepted as \ref sfx::path_arg, which turns any
 * stringy value into a NUL-terminated C string without copying where
 * possible. Argument and environment vectors for the spawn functions are
 * built with \ref sfx::cstring_vec.
 */

/// \private Defines &, | and |= for a scoped enum used as a set of flags
#define SFX_ENUM_FLAG_OPERATORS(type) \
inline bool operator&(type lhs, type rhs) { \
	return (static_cast<std::underlying_type_t<type>>(lhs) & static_cast<std::underlying_type_t<type>>(rhs)) != 0; \
} \
inline type operator|(type lhs, type rhs) { \
	return static_cast<type>(static_cast<std::underlying_type_t<type>>(lhs) | static_cast<std::underlying_type_t<type>>(rhs)); \
} \
inline type& operator|=(type& lhs, type rhs) { \
	lhs = lhs | rhs; \
	return lhs; \
}

/// \brief The namespace used by libsafix
namespace sfx {
}

#endif
