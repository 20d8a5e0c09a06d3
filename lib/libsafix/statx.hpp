#ifndef LIBSAFIX_STATX_HEADER
#define LIBSAFIX_STATX_HEADER

#include "fcntl.hpp"
#include "stat.hpp"

#include <stdint.h>
#include <sys/types.h>
#include <time.h>

/** \file
 * \brief Extended file status with the Linux statx call
 *
 * The types are available everywhere, \ref statx fails with ENOSYS where the
 * C library does not provide it.
 */

namespace sfx {

/// Fields requested from and reported by \ref statx. Values of the STATX_* constants.
enum class statx_mask : uint32_t
{
	none = 0,
	type = 0x1,
	mode = 0x2,
	nlink = 0x4,
	uid = 0x8,
	gid = 0x10,
	atime = 0x20,
	mtime = 0x40,
	ctime = 0x80,
	ino = 0x100,
	size = 0x200,
	blocks = 0x400,

	/// Everything that struct stat has as well
	basic_stats = 0x7ff,

	btime = 0x800,
	mnt_id = 0x1000
};
SFX_ENUM_FLAG_OPERATORS(statx_mask)

/// File attributes reported by \ref statx. Values of the STATX_ATTR_* constants.
enum class statx_attr : uint64_t
{
	none = 0,
	compressed = 0x4,
	immutable = 0x10,
	append = 0x20,
	nodump = 0x40,
	encrypted = 0x800,
	automount = 0x1000,
	mount_root = 0x2000,
	verity = 0x100000,
	dax = 0x200000
};
SFX_ENUM_FLAG_OPERATORS(statx_attr)

/// A timestamp as reported by \ref statx
struct statx_timestamp final
{
	int64_t sec{};
	uint32_t nsec{};

	timespec to_timespec() const
	{
		timespec ret{};
		ret.tv_sec = static_cast<time_t>(sec);
		ret.tv_nsec = static_cast<long>(nsec);
		return ret;
	}
};

class statx_info;

/** \brief Gets the status of a file, reporting only the requested fields.
 *
 * Relative paths are resolved against dirfd. With at_flag::empty_path and an
 * empty path, dirfd itself is examined, like \ref fstat. The kernel may fill in
 * more or fewer fields than requested, see \ref statx_info::mask.
 *
 * Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL statx(int dirfd, path_arg path, at_flag flags, statx_mask mask, statx_info& out);

/** \brief The result of \ref statx
 *
 * Only the fields named in \ref mask were filled in by the kernel, the others are zero.
 */
class SFX_PUBLIC_SYMBOL statx_info final
{
public:
	statx_mask mask() const { return mask_; }

	/// Shorthand for checking mask
	bool has(statx_mask fields) const { return (static_cast<uint32_t>(mask_) & static_cast<uint32_t>(fields)) == static_cast<uint32_t>(fields); }

	uint32_t blksize() const { return blksize_; }

	statx_attr attributes() const { return attributes_; }

	/// The attributes the file system supports, those not set here are never reported
	statx_attr attributes_mask() const { return attributes_mask_; }

	uint32_t nlink() const { return nlink_; }
	uid_t uid() const { return uid_; }
	gid_t gid() const { return gid_; }

	mode_t mode() const { return mode_; }
	file_type type() const { return mode_to_file_type(mode_); }
	mode_t access_mode() const { return mode_ & 07777; }

	bool is_suid() const { return (mode_ & S_ISUID) != 0; }
	bool is_sgid() const { return (mode_ & S_ISGID) != 0; }
	bool is_sticky() const { return (mode_ & S_ISVTX) != 0; }

	uint64_t ino() const { return ino_; }
	uint64_t size() const { return size_; }
	uint64_t blocks() const { return blocks_; }

	statx_timestamp atime() const { return atime_; }

	/// Creation time, check \ref has for statx_mask::btime first
	statx_timestamp btime() const { return btime_; }
	statx_timestamp ctime() const { return ctime_; }
	statx_timestamp mtime() const { return mtime_; }

	uint32_t rdev_major() const { return rdev_major_; }
	uint32_t rdev_minor() const { return rdev_minor_; }
	uint32_t dev_major() const { return dev_major_; }
	uint32_t dev_minor() const { return dev_minor_; }

	/// The device numbers combined like st_rdev and st_dev of struct stat
	dev_t rdev() const;
	dev_t dev() const;

	uint64_t mnt_id() const { return mnt_id_; }

private:
	friend result statx(int dirfd, path_arg path, at_flag flags, statx_mask mask, statx_info& out);

	statx_mask mask_{};
	uint32_t blksize_{};
	statx_attr attributes_{};
	uint32_t nlink_{};
	uid_t uid_{};
	gid_t gid_{};
	mode_t mode_{};
	uint64_t ino_{};
	uint64_t size_{};
	uint64_t blocks_{};
	statx_attr attributes_mask_{};
	statx_timestamp atime_;
	statx_timestamp btime_;
	statx_timestamp ctime_;
	statx_timestamp mtime_;
	uint32_t rdev_major_{};
	uint32_t rdev_minor_{};
	uint32_t dev_major_{};
	uint32_t dev_minor_{};
	uint64_t mnt_id_{};
};

/// \overload Requests statx_mask::basic_stats
inline result statx(int dirfd, path_arg path, at_flag flags, statx_info& out)
{
	return statx(dirfd, path, flags, statx_mask::basic_stats, out);
}

}

#endif
