#include "syscall.hpp"
#include "libsafix/fcntl.hpp"
#include "libsafix/file_desc.hpp"
#include "libsafix/glue/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace sfx {

file_desc::file_desc(int fd)
	: fd_(fd)
{
}

file_desc::~file_desc()
{
	reset();
}

file_desc::file_desc(file_desc && op) noexcept
	: fd_{op.fd_}
{
	op.fd_ = -1;
}

file_desc& file_desc::operator=(file_desc && op) noexcept
{
	if (this != &op) {
		reset();
		fd_ = op.fd_;
		op.fd_ = -1;
	}
	return *this;
}

int file_desc::release()
{
	int fd = fd_;
	fd_ = -1;
	return fd;
}

void file_desc::reset(int fd)
{
	if (fd_ != -1 && fd_ != fd) {
		::close(fd_);
	}
	fd_ = fd;
}

result file_desc::close()
{
	if (fd_ == -1) {
		return {result::invalid, EBADF};
	}
	int const fd = release();
	return check(::close(fd));
}

rwresult file_desc::read(void *buf, size_t count)
{
	return check_size(::read(fd_, buf, count));
}

rwresult file_desc::write(void const* buf, size_t count)
{
	return check_size(::write(fd_, buf, count));
}

rwresult file_desc::pread(void *buf, size_t count, off_t offset)
{
	return check_size(::pread(fd_, buf, count, offset));
}

rwresult file_desc::pwrite(void const* buf, size_t count, off_t offset)
{
	return check_size(::pwrite(fd_, buf, count, offset));
}

result file_desc::read_exact(void *buf, size_t count)
{
	auto* p = static_cast<unsigned char*>(buf);
	while (count) {
		ssize_t r = ::read(fd_, p, count);
		if (r == -1) {
			if (errno == EINTR) {
				continue;
			}
			return result_from_errno(errno);
		}
		if (!r) {
			return {result::invalid, EINVAL};
		}
		p += r;
		count -= static_cast<size_t>(r);
	}

	return {result::ok};
}

result file_desc::write_all(void const* buf, size_t count)
{
	auto const* p = static_cast<unsigned char const*>(buf);
	while (count) {
		ssize_t w = ::write(fd_, p, count);
		if (w == -1) {
			if (errno == EINTR) {
				continue;
			}
			return result_from_errno(errno);
		}
		if (!w) {
			return {result::other, EIO};
		}
		p += w;
		count -= static_cast<size_t>(w);
	}

	return {result::ok};
}

result file_desc::seek(int64_t offset, seek_mode m, int64_t& new_position)
{
	auto pos = ::lseek(fd_, static_cast<off_t>(offset), m);
	if (pos == static_cast<off_t>(-1)) {
		return result_from_errno(errno);
	}

	new_position = pos;
	return {result::ok};
}

result file_desc::tell(int64_t& position)
{
	return seek(0, current, position);
}

result file_desc::truncate(int64_t size)
{
	return check(::ftruncate(fd_, static_cast<off_t>(size)));
}

result file_desc::allocate([[maybe_unused]] int64_t offset, [[maybe_unused]] int64_t length)
{
#if HAVE_POSIX_FALLOCATE
	return check_code(posix_fallocate(fd_, static_cast<off_t>(offset), static_cast<off_t>(length)));
#else
	return {result::other, ENOSYS};
#endif
}

result file_desc::advise([[maybe_unused]] int64_t offset, [[maybe_unused]] int64_t length, [[maybe_unused]] access_pattern pattern)
{
#if HAVE_POSIX_FADVISE
	int advice = POSIX_FADV_NORMAL;
	switch (pattern) {
	case access_pattern::sequential:
		advice = POSIX_FADV_SEQUENTIAL;
		break;
	case access_pattern::random:
		advice = POSIX_FADV_RANDOM;
		break;
	case access_pattern::noreuse:
		advice = POSIX_FADV_NOREUSE;
		break;
	case access_pattern::willneed:
		advice = POSIX_FADV_WILLNEED;
		break;
	case access_pattern::dontneed:
		advice = POSIX_FADV_DONTNEED;
		break;
	default:
		break;
	}
	return check_code(posix_fadvise(fd_, static_cast<off_t>(offset), static_cast<off_t>(length), advice));
#else
	if (fd_ == -1) {
		return {result::invalid, EBADF};
	}
	return {result::ok};
#endif
}

result file_desc::sync_all()
{
	return check(::fsync(fd_));
}

result file_desc::sync_data()
{
#if HAVE_FDATASYNC
	return check(::fdatasync(fd_));
#else
	return check(::fsync(fd_));
#endif
}

result file_desc::stat(stat_info& out) const
{
	return fstat(fd_, out);
}

result file_desc::get_cloexec(bool& cloexec) const
{
	int flags{};
	auto r = fcntl_getfd(fd_, flags);
	if (r) {
		cloexec = (flags & FD_CLOEXEC) != 0;
	}
	return r;
}

result file_desc::set_cloexec(bool cloexec)
{
	return result_from_errno(sfx::set_cloexec(fd_, cloexec));
}

result file_desc::get_nonblocking(bool& nonblocking) const
{
	int flags{};
	auto r = fcntl_getfl(fd_, flags);
	if (r) {
		nonblocking = (flags & O_NONBLOCK) != 0;
	}
	return r;
}

result file_desc::set_nonblocking(bool nonblocking)
{
	return result_from_errno(sfx::set_nonblocking(fd_, nonblocking));
}

bool file_desc::isatty() const
{
	return ::isatty(fd_) == 1;
}

result file_desc::dup(file_desc& out) const
{
	int fd = ::dup(fd_);
	if (fd == -1) {
		return result_from_errno(errno);
	}

	out.reset(fd);
	return {result::ok};
}

result file_desc::dup_cloexec(file_desc& out) const
{
	return dupfd_cloexec(fd_, 0, out);
}

}
