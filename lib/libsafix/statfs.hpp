#ifndef LIBSAFIX_STATFS_HEADER
#define LIBSAFIX_STATFS_HEADER

#include "path.hpp"

#include <stdint.h>
#include <sys/types.h>

#if SFX_LINUX
#include <sys/statvfs.h>
#include <sys/vfs.h>
#else
#include <sys/param.h>
#include <sys/mount.h>
#endif

#include <string_view>

/** \file
 * \brief File system statistics: statfs and fstatfs
 */

namespace sfx {

#if SFX_LINUX
/// Mount flags reported by \ref statfs_info::flags
enum class statfs_flag : unsigned long
{
	none = 0,
	rdonly = ST_RDONLY,
	nosuid = ST_NOSUID,
#ifdef ST_NODEV
	nodev = ST_NODEV,
	noexec = ST_NOEXEC,
	synchronous = ST_SYNCHRONOUS,
	mandlock = ST_MANDLOCK,
	noatime = ST_NOATIME,
	nodiratime = ST_NODIRATIME,
	relatime = ST_RELATIME,
#endif
};
SFX_ENUM_FLAG_OPERATORS(statfs_flag)
#endif

/// Statistics about a mounted file system, wraps struct statfs
class SFX_PUBLIC_SYMBOL statfs_info final
{
public:
	/// Size of the blocks counted below
	uint64_t block_size() const { return static_cast<uint64_t>(st_.f_bsize); }

	uint64_t blocks() const { return static_cast<uint64_t>(st_.f_blocks); }
	uint64_t blocks_free() const { return static_cast<uint64_t>(st_.f_bfree); }

	/// Free blocks available to unprivileged users
	uint64_t blocks_available() const { return static_cast<uint64_t>(st_.f_bavail); }

	/// Total number of inodes
	uint64_t files() const { return static_cast<uint64_t>(st_.f_files); }
	uint64_t files_free() const { return static_cast<uint64_t>(st_.f_ffree); }

	fsid_t const& fsid() const { return st_.f_fsid; }

#if SFX_LINUX || SFX_MAC
	/// The file system type, e.g. 0x9fa0 for procfs on Linux
	uint64_t type() const { return static_cast<uint64_t>(st_.f_type); }
#endif

#if SFX_LINUX
	statfs_flag flags() const { return static_cast<statfs_flag>(st_.f_flags); }

	/// Maximum length of file names
	uint64_t name_max() const { return static_cast<uint64_t>(st_.f_namelen); }
#endif

#if SFX_BSD
	/// The file system type by name, e.g. "apfs"
	std::string_view type_name() const { return st_.f_fstypename; }
#endif

	struct statfs const& native() const { return st_; }
	struct statfs& native() { return st_; }

private:
	struct statfs st_{};
};

/// Gets the statistics of the file system containing path
result SFX_PUBLIC_SYMBOL statfs(path_arg path, statfs_info& out);

/// Gets the statistics of the file system containing the open file
result SFX_PUBLIC_SYMBOL fstatfs(int fd, statfs_info& out);

}

#endif
