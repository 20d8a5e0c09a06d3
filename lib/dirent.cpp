#include "syscall.hpp"
#include "libsafix/dirent.hpp"

#include <string.h>

namespace sfx {

file_type to_file_type(dirent_type t)
{
	switch (t) {
	case dirent_type::fifo:
		return file_type::fifo;
	case dirent_type::character:
		return file_type::character;
	case dirent_type::directory:
		return file_type::directory;
	case dirent_type::block:
		return file_type::block;
	case dirent_type::regular:
		return file_type::regular;
	case dirent_type::symlink:
		return file_type::symlink;
	case dirent_type::socket:
		return file_type::socket;
	default:
		return file_type::unknown;
	}
}

namespace {
#if HAVE_STRUCT_DIRENT_D_TYPE
dirent_type convert_type(unsigned char t)
{
	switch (t) {
	case DT_FIFO:
		return dirent_type::fifo;
	case DT_CHR:
		return dirent_type::character;
	case DT_DIR:
		return dirent_type::directory;
	case DT_BLK:
		return dirent_type::block;
	case DT_REG:
		return dirent_type::regular;
	case DT_LNK:
		return dirent_type::symlink;
	case DT_SOCK:
		return dirent_type::socket;
	default:
		return dirent_type::unknown;
	}
}
#endif
}

dir::~dir()
{
	close();
}

dir::dir(dir && op) noexcept
	: d_(op.d_)
{
	op.d_ = nullptr;
}

dir& dir::operator=(dir && op) noexcept
{
	if (this != &op) {
		close();
		d_ = op.d_;
		op.d_ = nullptr;
	}
	return *this;
}

result dir::open(path_arg path)
{
	return path.with_cstr([&](cstring_view p) -> result {
		DIR* d = ::opendir(p.c_str());
		if (!d) {
			return result_from_errno(errno);
		}

		close();
		d_ = d;
		return {result::ok};
	});
}

result dir::fdopen(file_desc && fd)
{
	DIR* d = ::fdopendir(fd.fd());
	if (!d) {
		return result_from_errno(errno);
	}

	fd.release();
	close();
	d_ = d;
	return {result::ok};
}

void dir::close()
{
	if (d_) {
		::closedir(d_);
		d_ = nullptr;
	}
}

result dir::read(dir_entry& entry, bool& end)
{
	if (!d_) {
		return {result::invalid, EBADF};
	}

	// readdir only sets errno on failure
	errno = 0;
	struct dirent* ent = ::readdir(d_);
	if (!ent) {
		if (errno) {
			return result_from_errno(errno);
		}
		end = true;
		return {result::ok};
	}

	end = false;
	entry.name_.assign(ent->d_name, strlen(ent->d_name));
	entry.ino_ = ent->d_ino;
#if HAVE_STRUCT_DIRENT_D_TYPE
	entry.type_ = convert_type(ent->d_type);
#else
	entry.type_ = dirent_type::unknown;
#endif
	return {result::ok};
}

void dir::rewind()
{
	if (d_) {
		::rewinddir(d_);
	}
}

int dir::fd() const
{
	return d_ ? ::dirfd(d_) : -1;
}

result dir::stat(stat_info& out) const
{
	if (!d_) {
		return {result::invalid, EBADF};
	}
	return sfx::fstat(::dirfd(d_), out);
}

result dir::fstatat(path_arg name, stat_info& out, at_flag flags) const
{
	if (!d_) {
		return {result::invalid, EBADF};
	}
	return sfx::fstatat(::dirfd(d_), name, out, flags);
}

result list_dir(path_arg path, std::vector<dir_entry>& entries)
{
	dir d;
	auto r = d.open(path);
	if (!r) {
		return r;
	}

	entries.clear();
	while (true) {
		dir_entry entry;
		bool end{};
		r = d.read(entry, end);
		if (!r) {
			return r;
		}
		if (end) {
			break;
		}
		entries.push_back(std::move(entry));
	}

	return {result::ok};
}

}
