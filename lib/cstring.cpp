#include "libsafix/cstring.hpp"

#include <string.h>

namespace sfx {

namespace {
char const empty_string[] = "";
}

cstring_view::cstring_view()
	: p_(empty_string)
{
}

cstring_view::cstring_view(char const* s)
	: p_(s)
	, size_(strlen(s))
{
}

cstring_view::cstring_view(cstring const& s)
	: p_(s.c_str())
	, size_(s.size())
{
}

std::optional<cstring_view> cstring_view::from_bytes_with_nul(std::string_view bytes)
{
	if (bytes.empty()) {
		return std::nullopt;
	}

	auto const* nul = static_cast<char const*>(memchr(bytes.data(), 0, bytes.size()));
	if (!nul || nul != bytes.data() + bytes.size() - 1) {
		return std::nullopt;
	}

	return cstring_view(bytes.data(), bytes.size() - 1);
}

std::optional<cstring_view> cstring_view::from_bytes_until_nul(std::string_view bytes)
{
	auto const* nul = static_cast<char const*>(memchr(bytes.data(), 0, bytes.size()));
	if (!nul) {
		return std::nullopt;
	}

	return cstring_view(bytes.data(), static_cast<size_t>(nul - bytes.data()));
}

cstring cstring_view::to_owned() const
{
	char* data = new char[size_ + 1];
	memcpy(data, p_, size_ + 1);
	return cstring(data, size_);
}

std::optional<cstring> cstring::create(std::string bytes, nul_error* error)
{
	auto const* nul = static_cast<char const*>(memchr(bytes.data(), 0, bytes.size()));
	if (nul) {
		if (error) {
			size_t const pos = static_cast<size_t>(nul - bytes.data());
			*error = nul_error(pos, std::move(bytes));
		}
		return std::nullopt;
	}

	size_t const size = bytes.size();
	char* data = new char[size + 1];
	memcpy(data, bytes.data(), size);
	data[size] = 0;
	return cstring(data, size);
}

cstring cstring::from_raw(char* p)
{
	return cstring(p, strlen(p));
}

cstring::~cstring()
{
	delete [] data_;
}

cstring::cstring(cstring const& op)
{
	if (op.data_) {
		data_ = new char[op.size_ + 1];
		memcpy(data_, op.data_, op.size_ + 1);
		size_ = op.size_;
	}
}

cstring& cstring::operator=(cstring const& op)
{
	if (this != &op) {
		char* data{};
		if (op.data_) {
			data = new char[op.size_ + 1];
			memcpy(data, op.data_, op.size_ + 1);
		}
		delete [] data_;
		data_ = data;
		size_ = op.size_;
	}

	return *this;
}

cstring::cstring(cstring && op) noexcept
	: data_(op.data_)
	, size_(op.size_)
{
	op.data_ = nullptr;
	op.size_ = 0;
}

cstring& cstring::operator=(cstring && op) noexcept
{
	if (this != &op) {
		delete [] data_;
		data_ = op.data_;
		size_ = op.size_;
		op.data_ = nullptr;
		op.size_ = 0;
	}

	return *this;
}

char* cstring::into_raw() &&
{
	char* ret = data_;
	if (!ret) {
		ret = new char[1];
		ret[0] = 0;
	}
	data_ = nullptr;
	size_ = 0;
	return ret;
}

std::string_view cstring::bytes() const
{
	return std::string_view(c_str(), size_);
}

std::string_view cstring::bytes_with_nul() const
{
	return std::string_view(c_str(), size_ + 1);
}

char const* cstring::c_str() const
{
	return data_ ? data_ : empty_string;
}

std::string cstring::into_bytes() &&
{
	std::string ret(bytes());
	delete [] data_;
	data_ = nullptr;
	size_ = 0;
	return ret;
}

}
