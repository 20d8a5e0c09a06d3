#ifndef LIBSAFIX_REGEX_HEADER
#define LIBSAFIX_REGEX_HEADER

#include "cstring.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <regex.h>

/** \file
 * \brief POSIX regular expressions: regcomp and regexec
 */

namespace sfx {

/// Flags for \ref regex::compile
enum class regex_cflag : int
{
	none = 0,

	/// Use extended instead of basic regular expressions
	extended = REG_EXTENDED,
	icase = REG_ICASE,

	/// Only report success or failure of a match, \ref regex::nsub becomes nullopt
	nosub = REG_NOSUB,

	/// Match-any-character operators don't match newlines, ^ and $ match at newlines
	newline = REG_NEWLINE
};
SFX_ENUM_FLAG_OPERATORS(regex_cflag)

/// Flags for \ref regex::matches and \ref regex::match_into
enum class regex_eflag : int
{
	none = 0,

	/// The start of the text is not the beginning of a line
	notbol = REG_NOTBOL,

	/// The end of the text is not the end of a line
	noteol = REG_NOTEOL
};
SFX_ENUM_FLAG_OPERATORS(regex_eflag)

/// A regcomp failure
class SFX_PUBLIC_SYMBOL regex_error final
{
public:
	regex_error() = default;
	regex_error(int code, std::string const& message)
		: code_(code)
		, message_(message)
	{}

	/// The REG_* error code
	int code() const { return code_; }

	/// The description as returned by regerror
	std::string const& message() const { return message_; }

private:
	int code_{};
	std::string message_;
};

/// The location of a group in a successfully matched text
class SFX_PUBLIC_SYMBOL regex_match final
{
public:
	regex_match() = default;
	explicit regex_match(regmatch_t const& m)
		: start_(m.rm_so)
		, end_(m.rm_eo)
	{}

	/// False for groups that did not participate in the match
	bool matched() const { return start_ != -1; }

	/// Offsets into the text, undefined unless \ref matched
	size_t start() const { return static_cast<size_t>(start_); }
	size_t end() const { return static_cast<size_t>(end_); }

private:
	regoff_t start_{-1};
	regoff_t end_{-1};
};

/** \brief A compiled POSIX regular expression
 *
 * Move-only. Matching is thread-safe.
 */
class SFX_PUBLIC_SYMBOL regex final
{
public:
	/** \brief Compiles the pattern.
	 *
	 * On failure returns nullopt and, if error is not null, stores the reason in it.
	 */
	static std::optional<regex> compile(cstring_view pattern, regex_cflag flags = regex_cflag::none, regex_error* error = nullptr);

	~regex();

	regex(regex const&) = delete;
	regex& operator=(regex const&) = delete;

	regex(regex && op) noexcept;
	regex& operator=(regex && op) noexcept;

	/// Number of parenthesized subexpressions, nullopt if compiled with regex_cflag::nosub
	std::optional<size_t> nsub() const;

	bool matches(cstring_view text, regex_eflag flags = regex_eflag::none) const;

	/** \brief Matches text and reports the location of all groups.
	 *
	 * On success, \c matches has \ref nsub + 1 elements, the first being the
	 * whole match. Groups that did not participate are not \ref regex_match::matched.
	 * With regex_cflag::nosub \c matches is left empty.
	 */
	bool match_into(cstring_view text, std::vector<regex_match>& matches, regex_eflag flags = regex_eflag::none) const;

	/** \brief Matches a byte range that may contain NUL bytes.
	 *
	 * Uses REG_STARTEND, so the whole of \c text is searched and NUL bytes are
	 * ordinary characters. Where the C library lacks REG_STARTEND, only the
	 * part of \c text in front of the first NUL byte is searched.
	 */
	bool matches_bytes(std::string_view text, regex_eflag flags = regex_eflag::none) const;

	/// Like \ref match_into for a byte range, see \ref matches_bytes. Offsets are relative to the start of \c text.
	bool match_bytes_into(std::string_view text, std::vector<regex_match>& matches, regex_eflag flags = regex_eflag::none) const;

private:
	regex() = default;

	bool exec_bytes(std::string_view text, std::vector<regmatch_t>& raw, regex_eflag flags) const;

	struct deleter {
		void operator()(regex_t* r) const;
	};

	std::unique_ptr<regex_t, deleter> preg_;
	bool nosub_{};
};

}

#endif
