#ifndef LIBSAFIX_FILE_DESC_HEADER
#define LIBSAFIX_FILE_DESC_HEADER

#include "error.hpp"
#include "stat.hpp"

#include <stdint.h>
#include <sys/types.h>
#include <unistd.h>

/** \file
 * \brief \ref sfx::file_desc, the owner of a file descriptor
 */

namespace sfx {

/** \brief Lean owner of a file descriptor
 *
 * Closes the descriptor on destruction. Move-only.
 *
 * I/O functions perform exactly one system call and return its result as is,
 * including EINTR. Use \ref read_exact and \ref write_all to transfer a
 * complete buffer.
 */
class SFX_PUBLIC_SYMBOL file_desc final
{
public:
	file_desc() = default;

	/** \brief Creates file_desc from descriptor
	 *
	 * Takes ownership of descriptor.
	 */
	explicit file_desc(int fd);

	~file_desc();

	file_desc(file_desc const&) = delete;
	file_desc& operator=(file_desc const&) = delete;

	file_desc(file_desc && op) noexcept;
	file_desc& operator=(file_desc && op) noexcept;

	bool opened() const { return fd_ != -1; }
	explicit operator bool() const { return opened(); }

	/// Returns the raw file descriptor, but retains ownership.
	int fd() const {
		return fd_;
	}

	/// Returns the raw file descriptor and gives up ownership.
	int release();

	/// Closes the descriptor, if any. Also takes ownership of the new one.
	void reset(int fd = -1);

	/** \brief Closes the descriptor and reports errors from close.
	 *
	 * The descriptor is released even if close fails.
	 */
	result close();

	/** \brief Read data
	 *
	 * \return The number of octets read, 0 at EOF. May be less than \c count at any time.
	 */
	rwresult read(void *buf, size_t count);

	/** \brief Write data
	 *
	 * \return The number of octets written. May be less than \c count.
	 */
	rwresult write(void const* buf, size_t count);

	/// Reads at the given offset without changing the file position
	rwresult pread(void *buf, size_t count, off_t offset);

	/// Writes at the given offset without changing the file position
	rwresult pwrite(void const* buf, size_t count, off_t offset);

	/** \brief Reads exactly \c count octets.
	 *
	 * Retries on EINTR. Fails with EINVAL on premature EOF, the data read so
	 * far is lost in that case.
	 */
	result read_exact(void *buf, size_t count);

	/** \brief Writes all \c count octets.
	 *
	 * Retries on EINTR. Fails with EIO if the system refuses to write any data.
	 */
	result write_all(void const* buf, size_t count);

	/// Used by \ref seek
	enum seek_mode {
		/// Seek from beginning of file
		begin = SEEK_SET,

		/// Seek from current position in the file
		current = SEEK_CUR,

		/// Seek from end of file
		end = SEEK_END
	};

	/** \brief Relative seek based on seek mode
	 *
	 * It is possible to seek past the end of the file. Doing so does
	 * not change the size of the file. It will only change on subsequent
	 * writes.
	 */
	result seek(int64_t offset, seek_mode m, int64_t& new_position);

	/// Gets current position in file
	result tell(int64_t& position);

	/// Sets the size of the file, extending it with zeros if needed
	result truncate(int64_t size);

	/// Ensures space is allocated for the given range, where supported
	result allocate(int64_t offset, int64_t length);

	/// Used by \ref advise
	enum class access_pattern {
		normal,
		sequential,
		random,
		noreuse,
		willneed,
		dontneed
	};

	/// Gives the kernel a hint on the expected access pattern. A no-op where unsupported.
	result advise(int64_t offset, int64_t length, access_pattern pattern);

	/// Ensure data and metadata are flushed to disk
	result sync_all();

	/// Ensure data is flushed to disk, metadata only if needed to read it back
	result sync_data();

	result stat(stat_info& out) const;

	result get_cloexec(bool& cloexec) const;
	result set_cloexec(bool cloexec = true);

	result get_nonblocking(bool& nonblocking) const;
	result set_nonblocking(bool nonblocking = true);

	/// Returns whether the descriptor refers to a terminal
	bool isatty() const;

	/// Duplicates the descriptor. The duplicate does not have FD_CLOEXEC set.
	result dup(file_desc& out) const;

	/// Duplicates the descriptor with FD_CLOEXEC set
	result dup_cloexec(file_desc& out) const;

private:
	int fd_{-1};
};

}

#endif
