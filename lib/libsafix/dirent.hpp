#ifndef LIBSAFIX_DIRENT_HEADER
#define LIBSAFIX_DIRENT_HEADER

#include "file_desc.hpp"
#include "stat.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <dirent.h>
#include <sys/types.h>

/** \file
 * \brief Directory streams: opendir, readdir and friends
 */

namespace sfx {

/// The type of a directory entry as reported by readdir, if the filesystem reports it at all
enum class dirent_type
{
	unknown,
	fifo,
	character,
	directory,
	block,
	regular,
	symlink,
	socket
};

/// Maps the entry type to the matching \ref file_type
file_type SFX_PUBLIC_SYMBOL to_file_type(dirent_type t);

/** \brief A single entry read from a \ref dir
 *
 * Holds a copy of the data, it stays valid after the directory stream advances or is closed.
 */
class SFX_PUBLIC_SYMBOL dir_entry final
{
public:
	dir_entry() = default;

	std::string_view name() const { return name_; }
	cstring_view name_cstr() const { return cstring_view(name_.c_str()); }

	ino_t ino() const { return ino_; }

	/** \brief The entry type
	 *
	 * Many filesystems do not fill in the type, in which case it is
	 * dirent_type::unknown. Use \ref dir::fstatat to get it then.
	 */
	dirent_type type() const { return type_; }

private:
	friend class dir;

	std::string name_;
	ino_t ino_{};
	dirent_type type_{};
};

/** \brief Move-only owner of a directory stream
 *
 * Entries are returned in the order the filesystem yields them, including "." and "..".
 */
class SFX_PUBLIC_SYMBOL dir final
{
public:
	dir() = default;
	~dir();

	dir(dir const&) = delete;
	dir& operator=(dir const&) = delete;

	dir(dir && op) noexcept;
	dir& operator=(dir && op) noexcept;

	/// Opens the directory, closing any previously open stream on success.
	result open(path_arg path);

	/** \brief Opens a stream on an already open directory descriptor
	 *
	 * On success the stream owns the descriptor and \c fd is left empty.
	 * On failure \c fd keeps it.
	 */
	result fdopen(file_desc && fd);

	bool opened() const { return d_ != nullptr; }
	explicit operator bool() const { return opened(); }

	void close();

	/** \brief Reads the next entry
	 *
	 * Sets \c end and returns success once there are no more entries.
	 */
	result read(dir_entry& entry, bool& end);

	/// Restarts the stream at the first entry
	void rewind();

	/// The underlying descriptor, still owned by the stream. -1 if not open.
	int fd() const;

	result stat(stat_info& out) const;

	/// Gets the status of an entry, relative paths are resolved against this directory.
	result fstatat(path_arg name, stat_info& out, at_flag flags = at_flag::none) const;

	DIR* native() const { return d_; }

private:
	DIR* d_{};
};

/// Reads all entries of the directory at path, including "." and ".."
result SFX_PUBLIC_SYMBOL list_dir(path_arg path, std::vector<dir_entry>& entries);

}

#endif
