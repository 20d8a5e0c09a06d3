#include "../lib/libsafix/fcntl.hpp"
#include "../lib/libsafix/file_desc.hpp"
#include "../lib/libsafix/recursive_remove.hpp"
#include "../lib/libsafix/stat.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

#include <stdio.h>

class recursive_remove_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(recursive_remove_test);
	CPPUNIT_TEST(test_logger);
	CPPUNIT_TEST(test_stderr_logger);
	CPPUNIT_TEST(test_remove_tree);
	CPPUNIT_TEST(test_remove_file);
	CPPUNIT_TEST(test_symlinks);
	CPPUNIT_TEST(test_missing);
	CPPUNIT_TEST(test_cancel);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_logger();
	void test_stderr_logger();
	void test_remove_tree();
	void test_remove_file();
	void test_symlinks();
	void test_missing();
	void test_cancel();

private:
	void touch(std::string const& path);
	bool exists(std::string const& path);
};

CPPUNIT_TEST_SUITE_REGISTRATION(recursive_remove_test);

namespace {
class refusing_remove final : public sfx::recursive_remove
{
protected:
	virtual bool confirm() const override { return false; }
};
}

void recursive_remove_test::touch(std::string const& path)
{
	sfx::file_desc fd;
	ASSERT_OK(sfx::open(fd, path, sfx::oflag::write_only | sfx::oflag::create | sfx::oflag::cloexec));
}

bool recursive_remove_test::exists(std::string const& path)
{
	sfx::stat_info st;
	return static_cast<bool>(sfx::lstat(path, st));
}

void recursive_remove_test::test_logger()
{
	sfx::test::capturing_logger logger;
	logger.set_all(sfx::logmsg::error);

	logger.log(sfx::logmsg::error, "%s %d", "value", 42);
	logger.log(sfx::logmsg::status, "dropped");
	logger.log_raw(sfx::logmsg::error, "100%");

	ASSERT_EQUAL(size_t(2), logger.messages_.size());
	CPPUNIT_ASSERT_EQUAL(std::string("value 42"), logger.messages_[0].second);
	CPPUNIT_ASSERT_EQUAL(std::string("100%"), logger.messages_[1].second);

	CPPUNIT_ASSERT(logger.should_log(sfx::logmsg::error));
	CPPUNIT_ASSERT(!logger.should_log(sfx::logmsg::status));
	logger.enable(sfx::logmsg::status);
	CPPUNIT_ASSERT(logger.should_log(sfx::logmsg::status));
	logger.disable(sfx::logmsg::error);
	CPPUNIT_ASSERT(!logger.should_log(sfx::logmsg::error));
	ASSERT_EQUAL(sfx::logmsg::status, logger.levels());

	CPPUNIT_ASSERT_EQUAL(std::string("error"), std::string(sfx::logmsg_name(sfx::logmsg::error)));
	CPPUNIT_ASSERT_EQUAL(std::string("debug"), std::string(sfx::logmsg_name(sfx::logmsg::debug_debug)));

	sfx::null_logger null;
	null.log(sfx::logmsg::error, "ignored %d", 1);
}

void recursive_remove_test::test_stderr_logger()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	int status = sfx::test::run_in_child([&] {
		if (!sfx::dup2(w.fd(), STDERR_FILENO)) {
			_exit(1);
		}
		sfx::stderr_logger logger;
		logger.log(sfx::logmsg::error, "Could not %s", "delete");
		logger.log(sfx::logmsg::debug_info, "hidden");
		logger.log_raw(sfx::logmsg::status, "done");
		fflush(stderr);
	});
	CPPUNIT_ASSERT(WIFEXITED(status));
	ASSERT_EQUAL(0, WEXITSTATUS(status));
	w.close();

	std::string out;
	while (true) {
		char buf[256];
		auto rr = r.read(buf, sizeof(buf));
		CPPUNIT_ASSERT(bool(rr));
		if (!rr.value_) {
			break;
		}
		out.append(buf, rr.value_);
	}
	CPPUNIT_ASSERT_EQUAL(std::string("error: Could not delete\nstatus: done\n"), out);
}

void recursive_remove_test::test_remove_tree()
{
	sfx::test::scratch_dir scratch;
	std::string const root = scratch.file("root");

	ASSERT_OK(sfx::mkdir(root));
	ASSERT_OK(sfx::mkdir(root + "/a"));
	ASSERT_OK(sfx::mkdir(root + "/a/b"));
	ASSERT_OK(sfx::mkdir(root + "/a/b/c"));
	ASSERT_OK(sfx::mkdir(root + "/empty"));
	touch(root + "/file");
	touch(root + "/a/file");
	touch(root + "/a/b/c/deep");
	for (int i = 0; i < 100; ++i) {
		touch(root + "/a/b/" + std::to_string(i));
	}

	sfx::test::capturing_logger logger;
	sfx::recursive_remove rr(logger);
	ASSERT_OK(rr.remove(root + "/"));
	CPPUNIT_ASSERT(!exists(root));
	CPPUNIT_ASSERT(logger.messages_.empty());

	// The parent is untouched
	CPPUNIT_ASSERT(exists(scratch.path()));
}

void recursive_remove_test::test_remove_file()
{
	sfx::test::scratch_dir scratch;
	touch(scratch.file("a"));
	touch(scratch.file("b"));
	ASSERT_OK(sfx::mkdir(scratch.file("c")));

	sfx::recursive_remove rr;
	ASSERT_OK(rr.remove(scratch.file("a")));
	CPPUNIT_ASSERT(!exists(scratch.file("a")));

	ASSERT_OK(rr.remove(std::list<std::string>{scratch.file("b"), scratch.file("c"), std::string()}));
	CPPUNIT_ASSERT(!exists(scratch.file("b")));
	CPPUNIT_ASSERT(!exists(scratch.file("c")));
}

void recursive_remove_test::test_symlinks()
{
	sfx::test::scratch_dir scratch;
	std::string const keep = scratch.file("keep");
	std::string const gone = scratch.file("gone");

	ASSERT_OK(sfx::mkdir(keep));
	touch(keep + "/precious");
	ASSERT_OK(sfx::mkdir(gone));
	ASSERT_OK(sfx::symlink(keep, gone + "/link"));
	ASSERT_OK(sfx::symlink("/nonexistent", gone + "/dangling"));

	sfx::recursive_remove rr;
	ASSERT_OK(rr.remove(gone));
	CPPUNIT_ASSERT(!exists(gone));

	// Links are removed, never followed
	CPPUNIT_ASSERT(exists(keep + "/precious"));
}

void recursive_remove_test::test_missing()
{
	sfx::test::scratch_dir scratch;
	touch(scratch.file("present"));

	sfx::test::capturing_logger logger;
	sfx::recursive_remove rr(logger);

	// Removal continues past the failure and reports the first error
	auto r = rr.remove(std::list<std::string>{scratch.file("missing"), scratch.file("present")});
	CPPUNIT_ASSERT(!r);
	ASSERT_EQUAL(ENOENT, r.raw_);
	CPPUNIT_ASSERT(!exists(scratch.file("present")));

	ASSERT_EQUAL(size_t(1), logger.messages_.size());
	ASSERT_EQUAL(sfx::logmsg::error, logger.messages_[0].first);
	CPPUNIT_ASSERT(logger.messages_[0].second.find(scratch.file("missing")) != std::string::npos);

	ASSERT_ERRNO(EINVAL, rr.remove(std::string("a\0b", 3)));
}

void recursive_remove_test::test_cancel()
{
	sfx::test::scratch_dir scratch;
	touch(scratch.file("f"));

	refusing_remove rr;
	ASSERT_ERRNO(ECANCELED, rr.remove(scratch.file("f")));
	CPPUNIT_ASSERT(exists(scratch.file("f")));
}
