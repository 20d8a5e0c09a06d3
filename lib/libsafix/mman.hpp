#ifndef LIBSAFIX_MMAN_HEADER
#define LIBSAFIX_MMAN_HEADER

#include "file_desc.hpp"
#include "path.hpp"

#include <sys/mman.h>

/** \file
 * \brief Memory locking, synchronization and advice, and anonymous memory files
 */

namespace sfx {

/// Locks the pages containing the range into RAM
result SFX_PUBLIC_SYMBOL mlock(void const* addr, size_t len);
result SFX_PUBLIC_SYMBOL munlock(void const* addr, size_t len);

/// Flags for \ref mlockall
enum class mlockall_flag : int
{
	/// Lock all pages currently mapped
	current = MCL_CURRENT,

	/// Lock all pages mapped in the future
	future = MCL_FUTURE,

#ifdef MCL_ONFAULT
	/// Together with current or future, lock pages only once they are faulted in
	onfault = MCL_ONFAULT,
#endif
};
SFX_ENUM_FLAG_OPERATORS(mlockall_flag)

/// Locks the whole address space of the process. Usually limited by RLIMIT_MEMLOCK.
result SFX_PUBLIC_SYMBOL mlockall(mlockall_flag flags);
result SFX_PUBLIC_SYMBOL munlockall();

/// Flags for \ref msync. Exactly one of async and sync must be given.
enum class msync_flag : int
{
	async = MS_ASYNC,
	sync = MS_SYNC,

	/// Invalidate other mappings of the same file
	invalidate = MS_INVALIDATE
};
SFX_ENUM_FLAG_OPERATORS(msync_flag)

/// Flushes changes to a file mapping back to the file. addr must be page-aligned.
result SFX_PUBLIC_SYMBOL msync(void* addr, size_t len, msync_flag flags);

/// Advice for \ref posix_madvise
enum class madvice : int
{
	normal = POSIX_MADV_NORMAL,
	sequential = POSIX_MADV_SEQUENTIAL,
	random = POSIX_MADV_RANDOM,
	willneed = POSIX_MADV_WILLNEED,
	dontneed = POSIX_MADV_DONTNEED
};

/// Gives the kernel a hint on the expected use of a range. addr must be page-aligned.
result SFX_PUBLIC_SYMBOL posix_madvise(void* addr, size_t len, madvice advice);

/// Flags for \ref memfd_create. Values of the MFD_* constants.
enum class memfd_flag : unsigned int
{
	none = 0,
	cloexec = 0x1,

	/// Allow file seals to be added with fcntl
	allow_sealing = 0x2,

	/// Back the file with huge pages
	hugetlb = 0x4
};
SFX_ENUM_FLAG_OPERATORS(memfd_flag)

/** \brief Creates an anonymous file living in memory.
 *
 * The name only shows up as the target of the /proc/self/fd symlink and
 * does not need to be unique. Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL memfd_create(file_desc& out, path_arg name, memfd_flag flags = memfd_flag::cloexec);

}

#endif
