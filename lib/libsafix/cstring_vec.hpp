#ifndef LIBSAFIX_CSTRING_VEC_HEADER
#define LIBSAFIX_CSTRING_VEC_HEADER

#include "cstring.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

/** \file
 * \brief \ref sfx::cstring_vec, the builder for argv and envp arrays
 */

namespace sfx {

/** \brief Owns a NULL-terminated array of C strings, as taken by execve and posix_spawn.
 *
 * The array always ends in a null pointer. Every other element is an owned
 * string leaked from a \ref cstring. The destructor frees all of them.
 *
 * Accessing elements out of bounds through \ref replace, \ref insert or \ref remove
 * is a programmer error and aborts the process. The trailing null pointer can be
 * neither replaced nor removed.
 *
 * Example:
 * \code
 * sfx::cstring_vec argv{"ls", "-l"};
 * // argv.data() is now {"ls", "-l", nullptr}
 * \endcode
 */
class SFX_PUBLIC_SYMBOL cstring_vec final
{
public:
	/// Creates an empty vector, which consists of just the trailing null pointer. Does not allocate.
	cstring_vec() = default;

	/// Creates an empty vector with room for at least \c capacity elements
	explicit cstring_vec(size_t capacity);

	/** \brief Creates a vector from strings.
	 *
	 * Strings containing a NUL byte cannot be represented and abort, check them
	 * with \ref cstring::create first if they come from untrusted input.
	 */
	cstring_vec(std::initializer_list<std::string_view> strings);

	explicit cstring_vec(std::vector<cstring> && strings);

	~cstring_vec();

	cstring_vec(cstring_vec const& op);
	cstring_vec& operator=(cstring_vec const& op);

	/// Leaves op as an empty vector without allocating
	cstring_vec(cstring_vec && op) noexcept;
	cstring_vec& operator=(cstring_vec && op) noexcept;

	/// Appends the string in front of the trailing null pointer
	void push(cstring && s);

	/** \brief Inserts the string at position i, shifting later elements back.
	 *
	 * \c i may address the trailing null pointer, in which case this is equivalent to \ref push.
	 */
	void insert(size_t i, cstring && s);

	/// Replaces the string at position i and frees the old one
	void replace(size_t i, cstring && s);

	/** \brief Removes the element at position i, shifting later elements forward.
	 *
	 * Returns the removed string, nullopt if the slot held a null pointer.
	 */
	std::optional<cstring> remove(size_t i);

	/// Returns the string at position i, nullopt for null pointers and indexes past the end.
	std::optional<cstring_view> get(size_t i) const;

	/// Raw access, includes the trailing null pointer
	char* operator[](size_t i) const { return v_.empty() ? nullptr : v_[i]; }

	/// Pointer to the array, suitable for execve and posix_spawn
	char* const* data() const;

	/// Number of elements, including the trailing null pointer. Never 0.
	size_t size() const { return v_.empty() ? 1 : v_.size(); }

	/// Number of strings, excluding the trailing null pointer
	size_t count() const { return size() - 1; }

	size_t capacity() const { return v_.capacity(); }
	void reserve(size_t n);

	/** \brief Releases the array to the caller.
	 *
	 * The caller becomes responsible for freeing each element with delete[].
	 * Afterwards this object is an empty vector.
	 */
	std::vector<char*> into_vec() &&;

	/** \brief Adopts an array previously returned by \ref into_vec.
	 *
	 * The caller guarantees that the array is non-empty, ends in a null pointer
	 * and that every non-null element came from \ref cstring::into_raw
	 * and has no other owner.
	 */
	static cstring_vec from_vec(std::vector<char*> && v);

	/// Debug representation, e.g. <tt>["ls", "-l", NULL]</tt>
	std::string to_string() const;

private:
	[[noreturn]] void out_of_bounds(char const* op, size_t i) const;
	void clear();

	// Adds the trailing null pointer if v_ is empty
	void ensure_terminated();

	// Empty, or a non-empty array ending in a null pointer. Empty stands for {nullptr}.
	std::vector<char*> v_;
};

inline std::string to_string(cstring_vec const& v) { return v.to_string(); }

}

#endif
