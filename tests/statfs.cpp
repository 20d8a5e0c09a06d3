#include "../lib/libsafix/statfs.hpp"
#include "../lib/libsafix/fcntl.hpp"
#include "../lib/libsafix/file_desc.hpp"

#include "test_utils.hpp"

#include <string.h>

class statfs_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(statfs_test);
	CPPUNIT_TEST(test_statfs);
	CPPUNIT_TEST(test_fstatfs);
	CPPUNIT_TEST(test_errors);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_statfs();
	void test_fstatfs();
	void test_errors();
};

CPPUNIT_TEST_SUITE_REGISTRATION(statfs_test);

void statfs_test::test_statfs()
{
	sfx::statfs_info fs;
	ASSERT_OK(sfx::statfs("/", fs));
	CPPUNIT_ASSERT(fs.block_size() > 0);
	CPPUNIT_ASSERT(fs.blocks_free() <= fs.blocks());
	CPPUNIT_ASSERT(fs.blocks_available() <= fs.blocks_free());
	CPPUNIT_ASSERT(fs.files_free() <= fs.files());

	// Tests write into the scratch directory, so it cannot be read-only
	sfx::test::scratch_dir dir;
	sfx::statfs_info scratch;
	ASSERT_OK(sfx::statfs(dir.path(), scratch));
#if SFX_LINUX
	CPPUNIT_ASSERT(!(scratch.flags() & sfx::statfs_flag::rdonly));
	CPPUNIT_ASSERT(scratch.name_max() > 0);

	sfx::stat_info st;
	if (sfx::stat("/proc/self", st)) {
		sfx::statfs_info proc;
		ASSERT_OK(sfx::statfs("/proc", proc));
		ASSERT_EQUAL(uint64_t(0x9fa0), proc.type());
	}
#endif
}

void statfs_test::test_fstatfs()
{
	sfx::test::scratch_dir dir;

	sfx::file_desc fd;
	ASSERT_OK(sfx::open(fd, dir.path(), sfx::oflag::read_only | sfx::oflag::directory | sfx::oflag::cloexec));

	sfx::statfs_info by_path;
	ASSERT_OK(sfx::statfs(dir.path(), by_path));
	sfx::statfs_info by_fd;
	ASSERT_OK(sfx::fstatfs(fd.fd(), by_fd));

	ASSERT_EQUAL(by_path.block_size(), by_fd.block_size());
	ASSERT_EQUAL(by_path.blocks(), by_fd.blocks());
	ASSERT_EQUAL(by_path.files(), by_fd.files());
	CPPUNIT_ASSERT(!memcmp(&by_path.fsid(), &by_fd.fsid(), sizeof(fsid_t)));
#if SFX_LINUX || SFX_MAC
	ASSERT_EQUAL(by_path.type(), by_fd.type());
#endif
}

void statfs_test::test_errors()
{
	sfx::statfs_info fs;
	ASSERT_ERRNO(ENOENT, sfx::statfs("/NOEXIST", fs));
	ASSERT_ERRNO(ENOENT, sfx::statfs("", fs));
	ASSERT_ERRNO(EBADF, sfx::fstatfs(-1, fs));
}
