#ifndef LIBSAFIX_UIO_HEADER
#define LIBSAFIX_UIO_HEADER

#include "error.hpp"

#include <vector>

#include <sys/types.h>
#include <sys/uio.h>

/** \file
 * \brief Scatter/gather I/O: readv, writev, preadv and pwritev
 *
 * Example, writing a header and a body with a single call:
 * \code
 * std::vector<iovec> iov{sfx::make_iovec(header.data(), header.size()), sfx::make_iovec(body.data(), body.size())};
 * while (!iov.empty()) {
 *     auto r = sfx::writev(fd, iov);
 *     if (!r) {
 *         break;
 *     }
 *     sfx::advance_iovecs(iov, r.value_);
 * }
 * \endcode
 */

namespace sfx {

/// An iovec over the given buffer. The buffer is not copied and must outlive the iovec.
inline iovec make_iovec(void const* buf, size_t len)
{
	iovec ret{};
	ret.iov_base = const_cast<void*>(buf);
	ret.iov_len = len;
	return ret;
}

/** \brief Drops the first n bytes from a list of buffers.
 *
 * Buffers that are consumed completely are removed, the first partially
 * consumed buffer is shortened. Consuming more bytes than the buffers hold
 * leaves the list empty.
 */
void SFX_PUBLIC_SYMBOL advance_iovecs(std::vector<iovec>& iov, size_t n);

/// Total number of bytes in the buffers
size_t SFX_PUBLIC_SYMBOL iovecs_size(std::vector<iovec> const& iov);

/** \brief Reads into the buffers in order.
 *
 * Only the first INT_MAX buffers are passed on, the system further limits
 * the count to IOV_MAX and fails with EINVAL beyond it.
 */
rwresult SFX_PUBLIC_SYMBOL readv(int fd, iovec const* iov, size_t count);

/// Writes the buffers in order, see \ref readv
rwresult SFX_PUBLIC_SYMBOL writev(int fd, iovec const* iov, size_t count);

inline rwresult readv(int fd, std::vector<iovec> const& iov) { return readv(fd, iov.data(), iov.size()); }
inline rwresult writev(int fd, std::vector<iovec> const& iov) { return writev(fd, iov.data(), iov.size()); }

/// Like \ref readv at the given offset, without changing the file position. Fails with ENOSYS where unsupported.
rwresult SFX_PUBLIC_SYMBOL preadv(int fd, iovec const* iov, size_t count, off_t offset);

/// Like \ref writev at the given offset, without changing the file position. Fails with ENOSYS where unsupported.
rwresult SFX_PUBLIC_SYMBOL pwritev(int fd, iovec const* iov, size_t count, off_t offset);

}

#endif
