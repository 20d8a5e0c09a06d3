#include "../lib/libsafix/mman.hpp"
#include "../lib/libsafix/fcntl.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

#include <string.h>

class mman_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(mman_test);
	CPPUNIT_TEST(test_mlock);
	CPPUNIT_TEST(test_mlockall);
	CPPUNIT_TEST(test_msync);
	CPPUNIT_TEST(test_madvise);
	CPPUNIT_TEST(test_memfd);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_mlock();
	void test_mlockall();
	void test_msync();
	void test_madvise();
	void test_memfd();
};

CPPUNIT_TEST_SUITE_REGISTRATION(mman_test);

namespace {
// Locking is limited by RLIMIT_MEMLOCK and may be forbidden entirely
bool lock_refused(sfx::result const& r)
{
	return r.raw_ == EPERM || r.raw_ == ENOMEM || r.raw_ == EAGAIN;
}
}

void mman_test::test_mlock()
{
	char buf[64]{};
	auto r = sfx::mlock(buf, sizeof(buf));
	if (r) {
		ASSERT_OK(sfx::munlock(buf, sizeof(buf)));
	}
	else {
		CPPUNIT_ASSERT_MESSAGE(sfx::to_string(r), lock_refused(r));
	}

	// Unlocking memory that was never locked is fine
	ASSERT_OK(sfx::munlock(buf, sizeof(buf)));
}

void mman_test::test_mlockall()
{
	// Locking the whole address space must not leak into the test runner
	int status = sfx::test::run_in_child([] {
		auto r = sfx::mlockall(sfx::mlockall_flag::current | sfx::mlockall_flag::future);
		if (!r && !lock_refused(r)) {
			_exit(1);
		}
		if (!sfx::munlockall()) {
			_exit(2);
		}
	});
	CPPUNIT_ASSERT(WIFEXITED(status));
	ASSERT_EQUAL(0, WEXITSTATUS(status));

	// Neither current nor future
	ASSERT_ERRNO(EINVAL, sfx::mlockall(static_cast<sfx::mlockall_flag>(0)));
}

void mman_test::test_msync()
{
	sfx::test::scratch_dir dir;
	sfx::file_desc fd;
	ASSERT_OK(sfx::open(fd, dir.file("f"), sfx::oflag::read_write | sfx::oflag::create | sfx::oflag::cloexec, 0600));

	long const page = sfx::getpagesize();
	ASSERT_OK(fd.truncate(page));

	void* p = ::mmap(nullptr, page, PROT_READ | PROT_WRITE, MAP_SHARED, fd.fd(), 0);
	CPPUNIT_ASSERT(p != MAP_FAILED);

	memcpy(p, "mapped", 6);
	ASSERT_OK(sfx::msync(p, page, sfx::msync_flag::sync));
	ASSERT_OK(sfx::msync(p, page, sfx::msync_flag::async | sfx::msync_flag::invalidate));

	char buf[6]{};
	ASSERT_OK(fd.pread(buf, 6, 0));
	CPPUNIT_ASSERT_EQUAL(std::string("mapped"), std::string(buf, 6));

	// Both at once is invalid, as is an unaligned address
	ASSERT_ERRNO(EINVAL, sfx::msync(p, page, sfx::msync_flag::sync | sfx::msync_flag::async));
	ASSERT_ERRNO(EINVAL, sfx::msync(static_cast<char*>(p) + 1, 1, sfx::msync_flag::sync));

	::munmap(p, page);
}

void mman_test::test_madvise()
{
	long const page = sfx::getpagesize();
	void* p = ::mmap(nullptr, page * 4, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
	CPPUNIT_ASSERT(p != MAP_FAILED);

	ASSERT_OK(sfx::posix_madvise(p, page * 4, sfx::madvice::sequential));
	ASSERT_OK(sfx::posix_madvise(p, page * 4, sfx::madvice::willneed));
	ASSERT_OK(sfx::posix_madvise(p, page * 4, sfx::madvice::normal));

	ASSERT_ERRNO(EINVAL, sfx::posix_madvise(static_cast<char*>(p) + 1, page, sfx::madvice::random));

	::munmap(p, page * 4);
}

void mman_test::test_memfd()
{
	sfx::file_desc fd;
	auto r = sfx::memfd_create(fd, "safix-test");
	if (!r && (r.raw_ == ENOSYS || r.raw_ == EPERM)) {
		return;
	}
	ASSERT_OK(r);
	CPPUNIT_ASSERT(fd);

	bool cloexec{};
	ASSERT_OK(fd.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	ASSERT_OK(fd.write_all("memory", 6));
	char buf[6]{};
	ASSERT_OK(fd.pread(buf, 6, 0));
	CPPUNIT_ASSERT_EQUAL(std::string("memory"), std::string(buf, 6));

#if SFX_LINUX
	std::string target;
	ASSERT_OK(sfx::readlink("/proc/self/fd/" + std::to_string(fd.fd()), target));
	CPPUNIT_ASSERT_EQUAL(std::string("/memfd:safix-test (deleted)"), target);
#endif

	sfx::file_desc inheritable;
	ASSERT_OK(sfx::memfd_create(inheritable, "other", sfx::memfd_flag::none));
	ASSERT_OK(inheritable.get_cloexec(cloexec));
	CPPUNIT_ASSERT(!cloexec);

	ASSERT_ERRNO(EINVAL, sfx::memfd_create(inheritable, "bad", static_cast<sfx::memfd_flag>(0x1000)));
}
