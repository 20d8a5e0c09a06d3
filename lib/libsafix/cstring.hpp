#ifndef LIBSAFIX_CSTRING_HEADER
#define LIBSAFIX_CSTRING_HEADER

#include "libsafix.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <stddef.h>

/** \file
 * \brief NUL-terminated strings for passing to and from C APIs.
 *
 * \ref sfx::cstring owns a buffer that ends in exactly one NUL byte and
 * contains no other. \ref sfx::cstring_view borrows one.
 */

namespace sfx {

class cstring;

/** \brief Returned when bytes passed to \ref cstring::create contain a NUL byte
 *
 * Holds the offset of the first NUL byte and hands the original
 * bytes back to the caller.
 */
class SFX_PUBLIC_SYMBOL nul_error final
{
public:
	nul_error() = default;
	nul_error(size_t position, std::string && bytes)
		: position_(position)
		, bytes_(std::move(bytes))
	{}

	/// Offset of the first NUL byte
	size_t position() const { return position_; }

	std::string const& bytes() const& { return bytes_; }
	std::string into_bytes() && { return std::move(bytes_); }

private:
	size_t position_{};
	std::string bytes_;
};

/** \brief Borrowed view of a NUL-terminated string
 *
 * Does not own the memory. The referenced string must outlive the view.
 */
class SFX_PUBLIC_SYMBOL cstring_view final
{
public:
	/// Views the empty string
	cstring_view();

	/** \brief Views a NUL-terminated C string.
	 *
	 * The length is determined with strlen. \c s must not be null.
	 */
	cstring_view(char const* s);

	cstring_view(cstring const& s);

	/** \brief Checked construction from bytes.
	 *
	 * Succeeds only if the last byte is a NUL and there is no other NUL.
	 */
	static std::optional<cstring_view> from_bytes_with_nul(std::string_view bytes);

	/// Views the bytes up to the first NUL. Fails if there is none.
	static std::optional<cstring_view> from_bytes_until_nul(std::string_view bytes);

	/// The bytes without the terminating NUL
	std::string_view bytes() const { return std::string_view(p_, size_); }

	/// The bytes including the terminating NUL
	std::string_view bytes_with_nul() const { return std::string_view(p_, size_ + 1); }

	char const* c_str() const { return p_; }

	/// Length without the terminating NUL
	size_t size() const { return size_; }
	bool empty() const { return size_ == 0; }

	std::string to_string() const { return std::string(p_, size_); }
	cstring to_owned() const;

	bool operator==(cstring_view const& op) const { return bytes() == op.bytes(); }
	bool operator!=(cstring_view const& op) const { return !(*this == op); }
	bool operator<(cstring_view const& op) const { return bytes() < op.bytes(); }

private:
	cstring_view(char const* p, size_t size)
		: p_(p)
		, size_(size)
	{}

	char const* p_;
	size_t size_{};
};

/** \brief Owned NUL-terminated byte buffer
 *
 * The buffer always ends in exactly one NUL byte and contains no other.
 * It can be leaked as a raw pointer with \ref into_raw and adopted again
 * with \ref from_raw, which is how \ref cstring_vec stores its elements.
 */
class SFX_PUBLIC_SYMBOL cstring final
{
public:
	/// Creates an empty string
	cstring() = default;

	/** \brief Creates a cstring from arbitrary bytes.
	 *
	 * Appends the terminating NUL. If the bytes contain a NUL, returns nullopt.
	 * If \c error is given, it then receives the offset of the first NUL
	 * together with the original bytes.
	 */
	static std::optional<cstring> create(std::string bytes, nul_error* error = nullptr);

	/** \brief Adopts a pointer previously returned by \ref into_raw.
	 *
	 * The caller guarantees that \c p came from \ref into_raw and that no one
	 * else owns it. Passing any other pointer is undefined behavior.
	 */
	static cstring from_raw(char* p);

	~cstring();

	cstring(cstring const& op);
	cstring& operator=(cstring const& op);

	cstring(cstring && op) noexcept;
	cstring& operator=(cstring && op) noexcept;

	/** \brief Releases ownership of the buffer.
	 *
	 * The returned pointer must eventually be passed to \ref from_raw or be
	 * freed with delete[].
	 */
	char* into_raw() &&;

	std::string_view bytes() const;
	std::string_view bytes_with_nul() const;
	char const* c_str() const;

	size_t size() const { return size_; }
	bool empty() const { return size_ == 0; }

	cstring_view as_view() const { return cstring_view(*this); }

	/// Converts back into a plain byte string
	std::string into_bytes() &&;

	bool operator==(cstring const& op) const { return bytes() == op.bytes(); }
	bool operator!=(cstring const& op) const { return !(*this == op); }
	bool operator<(cstring const& op) const { return bytes() < op.bytes(); }

private:
	friend class cstring_view;

	cstring(char* data, size_t size)
		: data_(data)
		, size_(size)
	{}

	// Null only for empty or moved-from strings
	char* data_{};
	size_t size_{};
};

inline std::string to_string(cstring const& s) { return std::string(s.bytes()); }
inline std::string to_string(cstring_view const& s) { return s.to_string(); }

}

#endif
