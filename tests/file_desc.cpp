#include "../lib/libsafix/fcntl.hpp"
#include "../lib/libsafix/file_desc.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

#include <string.h>

class file_desc_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(file_desc_test);
	CPPUNIT_TEST(test_open);
	CPPUNIT_TEST(test_io);
	CPPUNIT_TEST(test_seek);
	CPPUNIT_TEST(test_flags);
	CPPUNIT_TEST(test_ownership);
	CPPUNIT_TEST(test_dup);
	CPPUNIT_TEST(test_pipe);
	CPPUNIT_TEST(test_mkstemp);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_open();
	void test_io();
	void test_seek();
	void test_flags();
	void test_ownership();
	void test_dup();
	void test_pipe();
	void test_mkstemp();
};

CPPUNIT_TEST_SUITE_REGISTRATION(file_desc_test);

void file_desc_test::test_open()
{
	sfx::test::scratch_dir dir;
	std::string const name = dir.file("f");

	sfx::file_desc fd;
	ASSERT_ERRNO(ENOENT, sfx::open(fd, name, sfx::oflag::read_only));
	CPPUNIT_ASSERT(!fd);

	ASSERT_OK(sfx::open(fd, name, sfx::oflag::write_only | sfx::oflag::create | sfx::oflag::cloexec, 0600));
	CPPUNIT_ASSERT(fd);

	sfx::file_desc fd2;
	ASSERT_ERRNO(EEXIST, sfx::open(fd2, name, sfx::oflag::write_only | sfx::oflag::create | sfx::oflag::exclusive));

	ASSERT_ERRNO(ENOTDIR, sfx::open(fd2, name, sfx::oflag::read_only | sfx::oflag::directory));

	sfx::file_desc dirfd;
	ASSERT_OK(sfx::open(dirfd, dir.path(), sfx::oflag::read_only | sfx::oflag::directory));
	ASSERT_OK(sfx::openat(fd2, dirfd.fd(), "f", sfx::oflag::read_only));
	CPPUNIT_ASSERT(fd2);

	ASSERT_ERRNO(EINVAL, sfx::open(fd2, std::string("f\0g", 3), sfx::oflag::read_only));
	CPPUNIT_ASSERT(fd2);
}

void file_desc_test::test_io()
{
	sfx::test::scratch_dir dir;

	sfx::file_desc fd;
	ASSERT_OK(sfx::open(fd, dir.file("f"), sfx::oflag::read_write | sfx::oflag::create | sfx::oflag::cloexec));

	char const data[] = "Hello world";
	auto w = fd.write(data, 5);
	ASSERT_OK(w);
	ASSERT_EQUAL(size_t(5), w.value_);

	ASSERT_OK(fd.write_all(data + 5, strlen(data) - 5));

	char buf[32]{};
	auto r = fd.pread(buf, sizeof(buf), 0);
	ASSERT_OK(r);
	ASSERT_EQUAL(strlen(data), r.value_);
	CPPUNIT_ASSERT_EQUAL(std::string(data), std::string(buf, r.value_));

	ASSERT_OK(fd.pwrite("J", 1, 0));

	int64_t pos{};
	ASSERT_OK(fd.seek(0, sfx::file_desc::begin, pos));
	ASSERT_EQUAL(int64_t(0), pos);

	memset(buf, 0, sizeof(buf));
	ASSERT_OK(fd.read_exact(buf, 5));
	CPPUNIT_ASSERT_EQUAL(std::string("Jello"), std::string(buf, 5));

	// Premature EOF
	ASSERT_ERRNO(EINVAL, fd.read_exact(buf, 100));

	r = fd.read(buf, sizeof(buf));
	ASSERT_OK(r);
	ASSERT_EQUAL(size_t(0), r.value_);

	sfx::stat_info st;
	ASSERT_OK(fd.stat(st));
	ASSERT_EQUAL(off_t(strlen(data)), st.size());

	ASSERT_OK(fd.truncate(3));
	ASSERT_OK(fd.stat(st));
	ASSERT_EQUAL(off_t(3), st.size());

	// Not every filesystem supports preallocation
	auto const a = fd.allocate(0, 4096);
	CPPUNIT_ASSERT(a || a.raw_ == EOPNOTSUPP || a.raw_ == ENOSYS);
	if (a) {
		ASSERT_OK(fd.stat(st));
		ASSERT_EQUAL(off_t(4096), st.size());
	}
	ASSERT_OK(fd.advise(0, 0, sfx::file_desc::access_pattern::sequential));
	ASSERT_OK(fd.sync_data());
	ASSERT_OK(fd.sync_all());
	ASSERT_OK(sfx::fsync(fd.fd()));
}

void file_desc_test::test_seek()
{
	sfx::test::scratch_dir dir;

	sfx::file_desc fd;
	ASSERT_OK(sfx::open(fd, dir.file("f"), sfx::oflag::read_write | sfx::oflag::create));
	ASSERT_OK(fd.write_all("0123456789", 10));

	int64_t pos{};
	ASSERT_OK(fd.tell(pos));
	ASSERT_EQUAL(int64_t(10), pos);

	ASSERT_OK(fd.seek(-3, sfx::file_desc::end, pos));
	ASSERT_EQUAL(int64_t(7), pos);

	ASSERT_OK(fd.seek(1, sfx::file_desc::current, pos));
	ASSERT_EQUAL(int64_t(8), pos);

	// Seeking past the end does not grow the file
	ASSERT_OK(fd.seek(100, sfx::file_desc::begin, pos));
	sfx::stat_info st;
	ASSERT_OK(fd.stat(st));
	ASSERT_EQUAL(off_t(10), st.size());

	ASSERT_ERRNO(EINVAL, fd.seek(-1, sfx::file_desc::begin, pos));
}

void file_desc_test::test_flags()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe(r, w));

	bool cloexec{true};
	ASSERT_OK(r.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);

	ASSERT_OK(r.set_cloexec());
	ASSERT_OK(r.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	int flags{};
	ASSERT_OK(sfx::fcntl_getfd(r.fd(), flags));
	CPPUNIT_ASSERT(flags & FD_CLOEXEC);
	ASSERT_OK(sfx::fcntl_setfd(r.fd(), 0));
	ASSERT_OK(r.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);

	bool nonblocking{true};
	ASSERT_OK(r.get_nonblocking(nonblocking));
	CPPUNIT_ASSERT(!nonblocking);
	ASSERT_OK(r.set_nonblocking());
	ASSERT_OK(sfx::fcntl_getfl(r.fd(), flags));
	CPPUNIT_ASSERT(flags & O_NONBLOCK);

	char c;
	auto res = r.read(&c, 1);
	CPPUNIT_ASSERT(!res);
	ASSERT_EQUAL(sfx::rwresult::wouldblock, res.error_);

	ASSERT_OK(r.set_nonblocking(false));
	ASSERT_OK(r.get_nonblocking(nonblocking));
	CPPUNIT_ASSERT(!nonblocking);

	CPPUNIT_ASSERT(!r.isatty());
}

void file_desc_test::test_ownership()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	int const raw = r.fd();
	sfx::file_desc moved(std::move(r));
	CPPUNIT_ASSERT(!r);
	ASSERT_EQUAL(raw, moved.fd());

	int released = moved.release();
	ASSERT_EQUAL(raw, released);
	CPPUNIT_ASSERT(!moved);

	// Still open, nobody closed it
	int flags{};
	ASSERT_OK(sfx::fcntl_getfd(released, flags));

	moved.reset(released);
	ASSERT_OK(moved.close());
	CPPUNIT_ASSERT(!moved);
	ASSERT_ERRNO(EBADF, sfx::fcntl_getfd(released, flags));

	ASSERT_ERRNO(EBADF, moved.close());

	{
		sfx::file_desc scoped(w.release());
	}
	ASSERT_ERRNO(EBADF, sfx::close(raw + 1000));
}

void file_desc_test::test_dup()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	sfx::file_desc d;
	ASSERT_OK(w.dup(d));
	CPPUNIT_ASSERT(d.fd() != w.fd());
	bool cloexec{true};
	ASSERT_OK(d.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);

	sfx::file_desc dc;
	ASSERT_OK(w.dup_cloexec(dc));
	ASSERT_OK(dc.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	sfx::file_desc high;
	ASSERT_OK(sfx::dupfd_cloexec(w.fd(), 100, high));
	CPPUNIT_ASSERT(high.fd() >= 100);

	// All duplicates write into the same pipe
	ASSERT_OK(d.write_all("a", 1));
	ASSERT_OK(dc.write_all("b", 1));
	ASSERT_OK(high.write_all("c", 1));

	char buf[3];
	ASSERT_OK(r.read_exact(buf, 3));
	CPPUNIT_ASSERT_EQUAL(std::string("abc"), std::string(buf, 3));

	ASSERT_OK(sfx::dup2(w.fd(), d.fd()));

	// dup3 replaces the target and applies close-on-exec to the copy only
	sfx::file_desc target;
	ASSERT_OK(w.dup(target));
	ASSERT_OK(target.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);
	ASSERT_OK(sfx::dup3(r.fd(), target.fd(), sfx::oflag::cloexec));
	ASSERT_OK(target.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);
	ASSERT_OK(r.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	// target now reads from the pipe
	ASSERT_OK(w.write_all("d", 1));
	ASSERT_OK(target.read_exact(buf, 1));
	ASSERT_EQUAL('d', buf[0]);

	ASSERT_OK(sfx::dup3(w.fd(), target.fd(), sfx::oflag{}));
	ASSERT_OK(target.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);

	ASSERT_ERRNO(EINVAL, sfx::dup3(w.fd(), w.fd(), sfx::oflag::cloexec));
	ASSERT_ERRNO(EINVAL, sfx::dup3(w.fd(), target.fd(), sfx::oflag::nonblock));
	ASSERT_ERRNO(EBADF, sfx::dup3(-1, target.fd(), sfx::oflag{}));
}

void file_desc_test::test_pipe()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	bool cloexec{};
	ASSERT_OK(r.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);
	ASSERT_OK(w.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	ASSERT_OK(w.write_all("ping", 4));
	w.reset();

	char buf[8];
	auto res = r.read(buf, sizeof(buf));
	ASSERT_OK(res);
	ASSERT_EQUAL(size_t(4), res.value_);
	res = r.read(buf, sizeof(buf));
	ASSERT_OK(res);
	ASSERT_EQUAL(size_t(0), res.value_);

	// Writing into a pipe without readers, the test runner calls disable_sigpipe
	sfx::file_desc r2, w2;
	ASSERT_OK(sfx::pipe_cloexec(r2, w2));
	r2.reset();
	res = w2.write("x", 1);
	CPPUNIT_ASSERT(!res);
	ASSERT_EQUAL(EPIPE, res.raw_);
}

void file_desc_test::test_mkstemp()
{
	sfx::test::scratch_dir dir;

	std::string templ = dir.file("tmpXXXXXX");
	std::string const orig = templ;

	sfx::file_desc fd;
	ASSERT_OK(sfx::mkstemp(templ, fd));
	CPPUNIT_ASSERT(fd);
	CPPUNIT_ASSERT(templ != orig);
	ASSERT_EQUAL(orig.size(), templ.size());

	bool cloexec{};
	ASSERT_OK(fd.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	sfx::stat_info st;
	ASSERT_OK(sfx::stat(templ, st));
	CPPUNIT_ASSERT(st.is_regular());

	std::string bad = dir.file("noX");
	ASSERT_ERRNO(EINVAL, sfx::mkstemp(bad, fd));

	std::string nul = std::string("a\0XXXXXX", 8);
	ASSERT_ERRNO(EINVAL, sfx::mkstemp(nul, fd));
}
