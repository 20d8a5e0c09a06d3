#include "libsafix/cstring_vec.hpp"
#include "libsafix/format.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace sfx {

cstring_vec::cstring_vec(size_t capacity)
{
	v_.reserve(capacity + 1);
	v_.push_back(nullptr);
}

cstring_vec::cstring_vec(std::initializer_list<std::string_view> strings)
{
	v_.reserve(strings.size() + 1);
	v_.push_back(nullptr);
	for (auto const& s : strings) {
		auto cs = cstring::create(std::string(s));
		if (!cs) {
			std::cerr << "sfx::cstring_vec: string contains a NUL byte\n";
			std::abort();
		}
		push(std::move(*cs));
	}
}

cstring_vec::cstring_vec(std::vector<cstring> && strings)
{
	v_.reserve(strings.size() + 1);
	v_.push_back(nullptr);
	for (auto & s : strings) {
		push(std::move(s));
	}
	strings.clear();
}

cstring_vec::~cstring_vec()
{
	clear();
}

cstring_vec::cstring_vec(cstring_vec const& op)
{
	v_.reserve(op.v_.size());
	for (char* p : op.v_) {
		if (p) {
			v_.push_back(cstring_view(p).to_owned().into_raw());
		}
		else {
			v_.push_back(nullptr);
		}
	}
}

cstring_vec& cstring_vec::operator=(cstring_vec const& op)
{
	if (this != &op) {
		cstring_vec copy(op);
		*this = std::move(copy);
	}
	return *this;
}

cstring_vec::cstring_vec(cstring_vec && op) noexcept
	: v_(std::move(op.v_))
{
	op.v_.clear();
}

cstring_vec& cstring_vec::operator=(cstring_vec && op) noexcept
{
	if (this != &op) {
		clear();
		v_ = std::move(op.v_);
		op.v_.clear();
	}
	return *this;
}

char* const* cstring_vec::data() const
{
	static char* const empty[1]{};
	return v_.empty() ? empty : v_.data();
}

void cstring_vec::ensure_terminated()
{
	if (v_.empty()) {
		v_.push_back(nullptr);
	}
}

void cstring_vec::clear()
{
	for (char* p : v_) {
		delete [] p;
	}
	v_.clear();
}

void cstring_vec::push(cstring && s)
{
	// Grow first, so that nothing leaks if allocation fails
	ensure_terminated();
	v_.push_back(nullptr);
	v_[v_.size() - 2] = std::move(s).into_raw();
}

void cstring_vec::insert(size_t i, cstring && s)
{
	if (i >= size()) {
		out_of_bounds("insert", i);
	}

	ensure_terminated();
	v_.push_back(nullptr);
	std::rotate(v_.begin() + i, v_.end() - 1, v_.end());
	v_[i] = std::move(s).into_raw();
}

void cstring_vec::replace(size_t i, cstring && s)
{
	if (i + 1 >= size()) {
		out_of_bounds("replace", i);
	}

	char* old = v_[i];
	v_[i] = std::move(s).into_raw();
	if (old) {
		cstring::from_raw(old);
	}
}

std::optional<cstring> cstring_vec::remove(size_t i)
{
	if (i + 1 >= size()) {
		out_of_bounds("remove", i);
	}

	char* p = v_[i];
	v_.erase(v_.begin() + i);
	if (!p) {
		return std::nullopt;
	}
	return cstring::from_raw(p);
}

std::optional<cstring_view> cstring_vec::get(size_t i) const
{
	if (i >= v_.size() || !v_[i]) {
		return std::nullopt;
	}
	return cstring_view(v_[i]);
}

void cstring_vec::reserve(size_t n)
{
	v_.reserve(size() + n);
}

std::vector<char*> cstring_vec::into_vec() &&
{
	std::vector<char*> ret = std::move(v_);
	v_.clear();
	if (ret.empty()) {
		ret.push_back(nullptr);
	}
	return ret;
}

cstring_vec cstring_vec::from_vec(std::vector<char*> && v)
{
	cstring_vec ret;
	ret.v_ = std::move(v);
	return ret;
}

std::string cstring_vec::to_string() const
{
	std::string ret = "[";
	for (size_t i = 0; i < size(); ++i) {
		if (i) {
			ret += ", ";
		}
		if ((*this)[i]) {
			ret += '"';
			ret += (*this)[i];
			ret += '"';
		}
		else {
			ret += "NULL";
		}
	}
	ret += "]";
	return ret;
}

void cstring_vec::out_of_bounds(char const* op, size_t i) const
{
	std::cerr << sprintf("sfx::cstring_vec::%s: index %u out of bounds for vector of size %u (the trailing NULL cannot be modified)\n", op, i, size());
	std::abort();
}

}
