#include "syscall.hpp"
#include "libsafix/statx.hpp"

#if SFX_LINUX
#include <sys/sysmacros.h>
#endif

namespace sfx {

namespace {
#if HAVE_STATX
statx_timestamp convert(struct ::statx_timestamp const& ts)
{
	return {static_cast<int64_t>(ts.tv_sec), static_cast<uint32_t>(ts.tv_nsec)};
}
#endif
}

dev_t statx_info::rdev() const
{
	return makedev(rdev_major_, rdev_minor_);
}

dev_t statx_info::dev() const
{
	return makedev(dev_major_, dev_minor_);
}

result statx([[maybe_unused]] int dirfd, [[maybe_unused]] path_arg path, [[maybe_unused]] at_flag flags,
	[[maybe_unused]] statx_mask mask, [[maybe_unused]] statx_info& out)
{
#if HAVE_STATX
	return path.with_cstr([&](cstring_view p) {
		struct ::statx buf{};
		auto r = check(::statx(dirfd, p.c_str(), static_cast<int>(flags), static_cast<unsigned int>(mask), &buf));
		if (!r) {
			return r;
		}

		statx_info info;
		info.mask_ = static_cast<statx_mask>(buf.stx_mask);
		info.blksize_ = buf.stx_blksize;
		info.attributes_ = static_cast<statx_attr>(buf.stx_attributes);
		info.nlink_ = buf.stx_nlink;
		info.uid_ = buf.stx_uid;
		info.gid_ = buf.stx_gid;
		info.mode_ = buf.stx_mode;
		info.ino_ = buf.stx_ino;
		info.size_ = buf.stx_size;
		info.blocks_ = buf.stx_blocks;
		info.attributes_mask_ = static_cast<statx_attr>(buf.stx_attributes_mask);
		info.atime_ = convert(buf.stx_atime);
		info.btime_ = convert(buf.stx_btime);
		info.ctime_ = convert(buf.stx_ctime);
		info.mtime_ = convert(buf.stx_mtime);
		info.rdev_major_ = buf.stx_rdev_major;
		info.rdev_minor_ = buf.stx_rdev_minor;
		info.dev_major_ = buf.stx_dev_major;
		info.dev_minor_ = buf.stx_dev_minor;
#ifdef STATX_MNT_ID
		info.mnt_id_ = buf.stx_mnt_id;
#endif
		out = info;
		return r;
	});
#else
	return {result::other, ENOSYS};
#endif
}

}
