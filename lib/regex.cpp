#include "libsafix/regex.hpp"

#include <vector>

namespace sfx {

void regex::deleter::operator()(regex_t* r) const
{
	if (r) {
		regfree(r);
		delete r;
	}
}

std::optional<regex> regex::compile(cstring_view pattern, regex_cflag flags, regex_error* error)
{
	auto preg = std::make_unique<regex_t>();
	int res = regcomp(preg.get(), pattern.c_str(), static_cast<int>(flags));
	if (res) {
		if (error) {
			size_t len = regerror(res, preg.get(), nullptr, 0);
			std::vector<char> buf(len ? len : 1);
			regerror(res, preg.get(), buf.data(), buf.size());
			*error = regex_error(res, std::string(buf.data()));
		}
		return {};
	}

	regex ret;
	ret.preg_.reset(preg.release());
	ret.nosub_ = flags & regex_cflag::nosub;
	return ret;
}

regex::~regex() = default;

regex::regex(regex && op) noexcept = default;
regex& regex::operator=(regex && op) noexcept = default;

std::optional<size_t> regex::nsub() const
{
	if (nosub_) {
		return {};
	}
	return preg_->re_nsub;
}

bool regex::matches(cstring_view text, regex_eflag flags) const
{
	return regexec(preg_.get(), text.c_str(), 0, nullptr, static_cast<int>(flags)) == 0;
}

bool regex::match_into(cstring_view text, std::vector<regex_match>& matches, regex_eflag flags) const
{
	std::vector<regmatch_t> raw;
	if (!nosub_) {
		raw.resize(preg_->re_nsub + 1);
	}

	if (regexec(preg_.get(), text.c_str(), raw.size(), raw.empty() ? nullptr : raw.data(), static_cast<int>(flags)) != 0) {
		return false;
	}

	matches.clear();
	for (auto const& m : raw) {
		matches.emplace_back(m);
	}
	return true;
}

bool regex::exec_bytes(std::string_view text, std::vector<regmatch_t>& raw, regex_eflag flags) const
{
	// Never null, even for an empty view
	char const* const begin = text.empty() ? "" : text.data();

	// REG_STARTEND reads the range from the first element, even with nosub
	size_t const nmatch = nosub_ ? 0 : preg_->re_nsub + 1;
	raw.resize(nmatch ? nmatch : 1);

#ifdef REG_STARTEND
	raw[0].rm_so = 0;
	raw[0].rm_eo = static_cast<regoff_t>(text.size());
	return regexec(preg_.get(), begin, nmatch, raw.data(), static_cast<int>(flags) | REG_STARTEND) == 0;
#else
	std::string const copy(begin, text.size());
	return regexec(preg_.get(), copy.c_str(), nmatch, raw.data(), static_cast<int>(flags)) == 0;
#endif
}

bool regex::matches_bytes(std::string_view text, regex_eflag flags) const
{
	std::vector<regmatch_t> raw;
	return exec_bytes(text, raw, flags);
}

bool regex::match_bytes_into(std::string_view text, std::vector<regex_match>& matches, regex_eflag flags) const
{
	std::vector<regmatch_t> raw;
	if (!exec_bytes(text, raw, flags)) {
		return false;
	}

	matches.clear();
	if (!nosub_) {
		for (auto const& m : raw) {
			matches.emplace_back(m);
		}
	}
	return true;
}

}
