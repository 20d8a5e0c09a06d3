#ifndef LIBSAFIX_FORMAT_HEADER
#define LIBSAFIX_FORMAT_HEADER

#include "libsafix.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <stdint.h>

#ifdef SFX_FORMAT_DEBUG
#include <assert.h>
#define format_assert(pred) assert((pred))
#else
#define format_assert(pred)
#endif

/** \file
* \brief Header for the \ref sfx::sprintf "sprintf" string formatting function
*/

namespace sfx {

/// \cond
namespace detail {

// Get flags
enum : char {
	pad_0 = 1,
	pad_blank = 2,
	with_width = 4,
	left_align = 8,
	always_sign = 16
};

struct field final {
	size_t width{};
	char flags{};
	char type{};

	explicit operator bool() const { return type != 0; }
};

template<typename Arg>
bool is_negative([[maybe_unused]] Arg && v)
{
	if constexpr (std::is_signed_v<std::decay_t<Arg>>) {
		return v < 0;
	}
	else {
		return false;
	}
}

inline char hex_digit(unsigned int d, bool lowercase)
{
	if (d > 9) {
		return static_cast<char>((lowercase ? 'a' : 'A') + d - 10);
	}
	return static_cast<char>('0' + d);
}

template<typename Arg>
std::string integral_to_string(field const& f, Arg && arg)
{
	if constexpr (std::is_enum_v<std::decay_t<Arg>>) {
		return integral_to_string(f, static_cast<std::underlying_type_t<std::decay_t<Arg>>>(arg));
	}
	else if constexpr (std::is_same_v<std::decay_t<Arg>, bool>) {
		return integral_to_string(f, static_cast<int>(arg));
	}
	else if constexpr (std::is_integral_v<std::decay_t<Arg>>) {
		std::decay_t<Arg> v = arg;

		char lead{};
		if (is_negative(arg)) {
			lead = '-';
		}
		else if (f.flags & always_sign) {
			lead = '+';
		}
		else if (f.flags & pad_blank) {
			lead = ' ';
		}

		// max decimal digits in b-bit integer is floor((b-1) * log_10(2)) + 1 < b * 0.5 + 1
		char buf[sizeof(v) * 4 + 1];
		auto *const end = buf + sizeof(v) * 4 + 1;
		auto *p = end;

		do {
			int const mod = std::abs(static_cast<int>(v % 10));
			*(--p) = static_cast<char>('0' + mod);
			v /= 10;
		} while (v);

		size_t const digits = static_cast<size_t>(end - p);
		auto width = f.width;
		if (!(f.flags & with_width)) {
			if (lead) {
				*(--p) = lead;
			}
			return std::string(p, end);
		}

		if (lead && width > 0) {
			--width;
		}

		std::string ret;
		if (f.flags & pad_0) {
			if (lead) {
				ret += lead;
			}
			if (digits < width) {
				ret.append(width - digits, '0');
			}
			ret.append(p, end);
		}
		else {
			if (digits < width && !(f.flags & left_align)) {
				ret.append(width - digits, ' ');
			}
			if (lead) {
				ret += lead;
			}
			ret.append(p, end);
			if (digits < width && f.flags & left_align) {
				ret.append(width - digits, ' ');
			}
		}
		return ret;
	}
	else {
		format_assert(0);
		return std::string();
	}
}

template<typename Arg>
std::string integral_to_hex_string(Arg && arg, bool lowercase)
{
	if constexpr (std::is_enum_v<std::decay_t<Arg>>) {
		return integral_to_hex_string(static_cast<std::underlying_type_t<std::decay_t<Arg>>>(arg), lowercase);
	}
	else if constexpr (std::is_integral_v<std::decay_t<Arg>> && std::is_signed_v<std::decay_t<Arg>>) {
		return integral_to_hex_string(static_cast<std::make_unsigned_t<std::decay_t<Arg>>>(arg), lowercase);
	}
	else if constexpr (std::is_integral_v<std::decay_t<Arg>>) {
		std::decay_t<Arg> v = arg;
		char buf[sizeof(v) * 2];
		auto* const end = buf + sizeof(v) * 2;
		auto* p = end;

		do {
			*(--p) = hex_digit(static_cast<unsigned int>(v & 0xf), lowercase);
			v >>= 4;
		} while (v);

		return std::string(p, end);
	}
	else {
		format_assert(0);
		return std::string();
	}
}

// Types with an ADL-visible to_string(arg) returning a std::string, e.g. sfx::result or sfx::cstring
template<class Arg, typename = void>
struct has_to_string : std::false_type {};

template<class Arg>
struct has_to_string<Arg, std::enable_if_t<std::is_same_v<std::string, decltype(to_string(std::declval<Arg>()))>>> : std::true_type {};

template<typename Arg>
constexpr bool is_string_like_v = std::is_convertible_v<Arg, std::string_view> && !std::is_same_v<std::decay_t<Arg>, std::nullptr_t>;

template<typename Arg>
constexpr bool is_formattable_v = std::disjunction<
	std::is_enum<std::decay_t<Arg>>,
	std::is_arithmetic<std::decay_t<Arg>>,
	std::is_pointer<std::decay_t<Arg>>,
	std::bool_constant<is_string_like_v<Arg>>,
	has_to_string<Arg>
>::value;

template<typename Arg>
std::string to_format_string(Arg && arg)
{
	if constexpr (std::is_pointer_v<std::decay_t<Arg>> && std::is_convertible_v<Arg, char const*>) {
		char const* s = arg;
		return s ? std::string(s) : std::string("(null)");
	}
	else if constexpr (is_string_like_v<Arg>) {
		return std::string(std::string_view(arg));
	}
	else if constexpr (has_to_string<Arg>::value) {
		return to_string(std::forward<Arg>(arg));
	}
	else if constexpr (std::is_arithmetic_v<std::decay_t<Arg>>) {
		return std::to_string(arg);
	}
	else {
		format_assert(0);
		return std::string();
	}
}

inline void pad_arg(std::string& s, field const& f)
{
	if (f.flags & with_width && s.size() < f.width) {
		if (f.flags & left_align) {
			s += std::string(f.width - s.size(), ' ');
		}
		else {
			s = std::string(f.width - s.size(), (f.flags & pad_0) ? '0' : ' ') + s;
		}
	}
}

template<typename Arg>
std::string format_arg(field const& f, Arg&& arg)
{
	std::string ret;
	if (f.type == 's') {
		ret = to_format_string(std::forward<Arg>(arg));
		pad_arg(ret, f);
	}
	else if (f.type == 'd' || f.type == 'i' || f.type == 'u') {
		ret = integral_to_string(f, std::forward<Arg>(arg));
	}
	else if (f.type == 'x' || f.type == 'X') {
		ret = integral_to_hex_string(std::forward<Arg>(arg), f.type == 'x');
		pad_arg(ret, f);
	}
	else if (f.type == 'p') {
		if constexpr (std::is_pointer_v<std::decay_t<Arg>>) {
			ret = "0x" + integral_to_hex_string(reinterpret_cast<uintptr_t>(arg), true);
		}
		else {
			format_assert(0);
		}
		pad_arg(ret, f);
	}
	else if (f.type == 'c') {
		if constexpr (std::is_integral_v<std::decay_t<Arg>>) {
			ret = std::string(1, static_cast<char>(static_cast<unsigned char>(arg)));
		}
		else {
			format_assert(0);
		}
	}
	else {
		format_assert(0);
	}
	return ret;
}

inline std::string extract_arg(field const&, size_t)
{
	return std::string();
}

template<typename Arg, typename... Args>
std::string extract_arg(field const& f, size_t arg_n, Arg&& arg, Args&&...args)
{
	if (!arg_n) {
		return format_arg(f, std::forward<Arg>(arg));
	}
	return extract_arg(f, arg_n - 1, std::forward<Args>(args)...);
}

inline field get_field(std::string_view const& fmt, std::string_view::size_type & pos, size_t& arg_n, std::string & ret)
{
	field f;
	if (++pos >= fmt.size()) {
		format_assert(0);
		return f;
	}

	// Get literal percent out of the way
	if (fmt[pos] == '%') {
		ret += '%';
		++pos;
		return f;
	}

parse_start:
	while (true) {
		if (fmt[pos] == '0') {
			f.flags |= pad_0;
		}
		else if (fmt[pos] == ' ') {
			f.flags |= pad_blank;
		}
		else if (fmt[pos] == '-') {
			f.flags &= ~pad_0;
			f.flags |= left_align;
		}
		else if (fmt[pos] == '+') {
			f.flags &= ~pad_blank;
			f.flags |= always_sign;
		}
		else {
			break;
		}
		if (++pos >= fmt.size()) {
			format_assert(0);
			return f;
		}
	}

	// Field width
	while (fmt[pos] >= '0' && fmt[pos] <= '9') {
		f.flags |= with_width;
		f.width *= 10;
		f.width += fmt[pos] - '0';
		if (++pos >= fmt.size()) {
			format_assert(0);
			return f;
		}
	}
	if (f.width > 10000) {
		format_assert(0);
		f.width = 10000;
	}

	if (fmt[pos] == '$') {
		// Positional argument, start over
		arg_n = f.width - 1;
		f.width = 0;
		f.flags = 0;
		if (++pos >= fmt.size()) {
			format_assert(0);
			return f;
		}
		goto parse_start;
	}

	// Ignore length modifier
	while (true) {
		auto c = fmt[pos];
		if (c == 'h' || c == 'l' || c == 'L' || c == 'j' || c == 'z' || c == 't') {
			if (++pos >= fmt.size()) {
				format_assert(0);
				return f;
			}
		}
		else {
			break;
		}
	}

	f.type = static_cast<char>(fmt[pos++]);
	return f;
}

template<typename Arg, int N>
constexpr bool check_argument()
{
	static_assert(is_formattable_v<Arg>, "Argument cannot be formatted by sfx::sprintf()");
	return is_formattable_v<Arg>;
}

template<typename... Args, std::size_t... Is>
constexpr bool check_arguments(std::index_sequence<Is...>)
{
	return (check_argument<Args, Is>() && ...);
}

template<typename... Args>
std::string do_sprintf(std::string_view const& fmt, Args&&... args)
{
	std::string ret;

	// Find % characters
	std::string_view::size_type start = 0, pos;

	size_t arg_n{};
	while ((pos = fmt.find('%', start)) != std::string_view::npos) {

		// Copy segment preceding the %
		ret += fmt.substr(start, pos - start);

		field f = detail::get_field(fmt, pos, arg_n, ret);
		if (f) {
			format_assert(arg_n < sizeof...(args));
			ret += detail::extract_arg(f, arg_n++, std::forward<Args>(args)...);
		}

		start = pos;
	}

	// Copy remainder of string
	ret += fmt.substr(start);

	return ret;
}
}
/// \endcond

/** \brief A simple type-safe sprintf replacement
*
* Only partially implements the format specifiers for the printf family of C functions:
*
* \li Positional arguments
* \li Supported flags: 0, ' ', -, +
* \li Field widths are supported as decimal integers not exceeding 10k, longer widths are truncated
* \li precision is ignored
* \li Supported types: d, i, u, s, x, X, p, c
*
* String arguments can be anything convertible to std::string_view, or any type
* for which an unqualified to_string(arg) call yields a std::string, such as
* \ref sfx::result and \ref sfx::cstring.
*
* Asserts if unsupported types are passed or if the types don't match the arguments. Fails gracefully with NDEBUG.
*
* Example:
*
* \code
* std::string s = sfx::sprintf("%2$s %1$s", "foo", std::string("bar"));
* assert(s == "bar foo"); // This is true
* \endcode
*/
template<typename... Args>
std::string sprintf(std::string_view const& fmt, Args&&... args)
{
	detail::check_arguments<Args...>(std::index_sequence_for<Args...>());

	return detail::do_sprintf(fmt, std::forward<Args>(args)...);
}

}

#endif
