#include "../lib/libsafix/pidfd.hpp"
#include "../lib/libsafix/poll.hpp"
#include "../lib/libsafix/spawn.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

class pidfd_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(pidfd_test);
	CPPUNIT_TEST(test_signal);
	CPPUNIT_TEST(test_getfd);
	CPPUNIT_TEST(test_errors);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_signal();
	void test_getfd();
	void test_errors();

private:
	// Kernels before 5.3 or seccomp filters
	bool unavailable(sfx::result const& r) const { return !r && (r.raw_ == ENOSYS || r.raw_ == EPERM); }
};

CPPUNIT_TEST_SUITE_REGISTRATION(pidfd_test);

void pidfd_test::test_signal()
{
	// The child waits for its stdin to be closed
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));
	sfx::spawn_file_actions actions;
	ASSERT_OK(actions.add_dup2(r.fd(), STDIN_FILENO));
	pid_t pid{};
	ASSERT_OK(sfx::spawn(pid, "/bin/sh", &actions, nullptr, sfx::cstring_vec{"sh", "-c", "read x"}));

	sfx::file_desc pidfd;
	auto res = sfx::pidfd_open(pidfd, pid);
	if (unavailable(res)) {
		w.reset();
		int status{};
		ASSERT_OK(sfx::wait_pid(pid, status));
		return;
	}
	ASSERT_OK(res);

	bool cloexec{};
	ASSERT_OK(pidfd.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	// Not readable while the process runs
	std::vector<pollfd> fds{sfx::make_pollfd(pidfd.fd(), sfx::poll_event::in)};
	size_t ready{};
	ASSERT_OK(sfx::poll(fds, 0, ready));
	ASSERT_EQUAL(size_t(0), ready);

	ASSERT_OK(sfx::pidfd_send_signal(pidfd.fd(), SIGTERM));

	ASSERT_OK(sfx::poll(fds, 5000, ready));
	ASSERT_EQUAL(size_t(1), ready);

	int status{};
	ASSERT_OK(sfx::wait_pid(pid, status));
	CPPUNIT_ASSERT(sfx::term_signal(status) == SIGTERM);

	// The process is gone, but the descriptor still refers to it
	ASSERT_ERRNO(ESRCH, sfx::pidfd_send_signal(pidfd.fd(), SIGTERM));
}

void pidfd_test::test_getfd()
{
	sfx::file_desc self;
	auto res = sfx::pidfd_open(self, sfx::getpid());
	if (unavailable(res)) {
		return;
	}
	ASSERT_OK(res);

	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	sfx::file_desc copy;
	res = sfx::pidfd_getfd(copy, self.fd(), w.fd());
	if (unavailable(res)) {
		return;
	}
	ASSERT_OK(res);
	CPPUNIT_ASSERT(copy.fd() != w.fd());

	bool cloexec{};
	ASSERT_OK(copy.get_cloexec(cloexec));
	CPPUNIT_ASSERT(cloexec);

	// Same pipe
	ASSERT_OK(copy.write_all("z", 1));
	char c{};
	ASSERT_OK(r.read_exact(&c, 1));
	ASSERT_EQUAL('z', c);

	ASSERT_ERRNO(EBADF, sfx::pidfd_getfd(copy, self.fd(), -1));
}

void pidfd_test::test_errors()
{
	sfx::file_desc fd;
	auto res = sfx::pidfd_open(fd, sfx::getpid());
	if (unavailable(res)) {
		return;
	}
	ASSERT_OK(res);

	sfx::file_desc other;
	ASSERT_ERRNO(EINVAL, sfx::pidfd_open(other, -1));
	ASSERT_ERRNO(EINVAL, sfx::pidfd_open(other, sfx::getpid(), 0x1));
	CPPUNIT_ASSERT(!other);

	ASSERT_ERRNO(EBADF, sfx::pidfd_send_signal(-1, 0));

	// Signal 0 only checks that the process exists
	ASSERT_OK(sfx::pidfd_send_signal(fd.fd(), 0));
	ASSERT_ERRNO(EINVAL, sfx::pidfd_send_signal(fd.fd(), 0, 0x100));
}
