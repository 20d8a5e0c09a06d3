#include "../lib/libsafix/clock.hpp"
#include "../lib/libsafix/poll.hpp"
#include "../lib/libsafix/resource.hpp"
#include "../lib/libsafix/stdlib.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

#include <string.h>

class system_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(system_test);
	CPPUNIT_TEST(test_poll);
	CPPUNIT_TEST(test_ppoll);
	CPPUNIT_TEST(test_realpath);
	CPPUNIT_TEST(test_random);
	CPPUNIT_TEST(test_pty);
	CPPUNIT_TEST(test_env);
	CPPUNIT_TEST(test_rlimit);
	CPPUNIT_TEST(test_rusage);
	CPPUNIT_TEST(test_priority);
	CPPUNIT_TEST(test_clock);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_poll();
	void test_ppoll();
	void test_realpath();
	void test_random();
	void test_pty();
	void test_env();
	void test_rlimit();
	void test_rusage();
	void test_priority();
	void test_clock();
};

CPPUNIT_TEST_SUITE_REGISTRATION(system_test);

void system_test::test_poll()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));

	std::vector<pollfd> fds{sfx::make_pollfd(r.fd(), sfx::poll_event::in), sfx::make_pollfd(w.fd(), sfx::poll_event::out)};

	size_t ready{};
	ASSERT_OK(sfx::poll(fds, 0, ready));
	ASSERT_EQUAL(size_t(1), ready);
	CPPUNIT_ASSERT(!(sfx::returned_events(fds[0]) & sfx::poll_event::in));
	CPPUNIT_ASSERT(sfx::returned_events(fds[1]) & sfx::poll_event::out);

	ASSERT_OK(w.write_all("x", 1));
	ASSERT_OK(sfx::poll(fds, 1000, ready));
	ASSERT_EQUAL(size_t(2), ready);
	CPPUNIT_ASSERT(sfx::returned_events(fds[0]) & sfx::poll_event::in);

	// Closing the write end hangs up the read end
	fds.pop_back();
	char c;
	ASSERT_OK(r.read_exact(&c, 1));
	w.reset();
	ASSERT_OK(sfx::poll(fds, 1000, ready));
	ASSERT_EQUAL(size_t(1), ready);
	CPPUNIT_ASSERT(sfx::returned_events(fds[0]) & sfx::poll_event::hup);

	// Invalid descriptors are reported per entry
	std::vector<pollfd> bad{sfx::make_pollfd(r.fd() + 1000, sfx::poll_event::in)};
	ASSERT_OK(sfx::poll(bad, 0, ready));
	ASSERT_EQUAL(size_t(1), ready);
	CPPUNIT_ASSERT(sfx::returned_events(bad[0]) & sfx::poll_event::nval);

	std::vector<pollfd> none;
	ASSERT_OK(sfx::poll(none, 0, ready));
	ASSERT_EQUAL(size_t(0), ready);
}

void system_test::test_ppoll()
{
	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));
	std::vector<pollfd> fds{sfx::make_pollfd(r.fd(), sfx::poll_event::in)};

	timespec timeout{0, 1000000};
	sfx::sig_set mask;
	size_t ready{42};
	auto res = sfx::ppoll(fds, &timeout, &mask, ready);
	if (!res) {
		ASSERT_EQUAL(ENOSYS, res.raw_);
		return;
	}
	ASSERT_EQUAL(size_t(0), ready);

	ASSERT_OK(w.write_all("x", 1));
	ASSERT_OK(sfx::ppoll(fds, nullptr, nullptr, ready));
	ASSERT_EQUAL(size_t(1), ready);
}

void system_test::test_realpath()
{
	sfx::test::scratch_dir dir;
	ASSERT_OK(sfx::mkdir(dir.file("a")));
	ASSERT_OK(sfx::symlink("a", dir.file("link")));

	std::string real_dir;
	ASSERT_OK(sfx::realpath(dir.path(), real_dir));

	std::string out;
	ASSERT_OK(sfx::realpath(dir.file("link/../a/./"), out));
	CPPUNIT_ASSERT_EQUAL(real_dir + "/a", out);

	ASSERT_ERRNO(ENOENT, sfx::realpath(dir.file("missing"), out));
	ASSERT_ERRNO(EINVAL, sfx::realpath(std::string("/\0", 2), out));
}

void system_test::test_random()
{
	unsigned char a[32]{};
	unsigned char b[32]{};

	size_t written{};
	auto res = sfx::getrandom(a, sizeof(a), sfx::random_flag::none, written);
	if (res) {
		ASSERT_EQUAL(sizeof(a), written);
		ASSERT_OK(sfx::getrandom(b, sizeof(b), sfx::random_flag::nonblock, written));
		CPPUNIT_ASSERT(memcmp(a, b, sizeof(a)) != 0);
	}
	else {
		ASSERT_EQUAL(ENOSYS, res.raw_);
	}

	res = sfx::getentropy(a, sizeof(a));
	if (res) {
		// At most 256 bytes per call
		unsigned char big[257];
		ASSERT_ERRNO(EIO, sfx::getentropy(big, sizeof(big)));
	}
	else {
		ASSERT_EQUAL(ENOSYS, res.raw_);
	}
}

void system_test::test_pty()
{
	sfx::file_desc master;
	auto res = sfx::posix_openpt(master, sfx::oflag::read_write | sfx::oflag::noctty);
	if (!res) {
		// Containers may come without /dev/ptmx
		return;
	}

	ASSERT_OK(sfx::grantpt(master.fd()));
	ASSERT_OK(sfx::unlockpt(master.fd()));

	std::string name;
	ASSERT_OK(sfx::ptsname(master.fd(), name));
	CPPUNIT_ASSERT(name.find("/dev/") == 0);

	sfx::file_desc slave;
	ASSERT_OK(sfx::open(slave, name, sfx::oflag::read_write | sfx::oflag::noctty | sfx::oflag::cloexec));
	CPPUNIT_ASSERT(slave.isatty());

	bool tty{};
	ASSERT_OK(sfx::isatty(slave.fd(), tty));
	CPPUNIT_ASSERT(tty);

	std::string tname;
	ASSERT_OK(sfx::ttyname(slave.fd(), tname));
	CPPUNIT_ASSERT_EQUAL(name, tname);

	sfx::file_desc r, w;
	ASSERT_OK(sfx::pipe_cloexec(r, w));
	ASSERT_ERRNO(ENOTTY, sfx::ptsname(r.fd(), name));
}

void system_test::test_env()
{
	std::optional<std::string> value;
	ASSERT_OK(sfx::unsetenv("SFX_TEST_ENV"));
	ASSERT_OK(sfx::getenv("SFX_TEST_ENV", value));
	CPPUNIT_ASSERT(!value);

	ASSERT_OK(sfx::setenv("SFX_TEST_ENV", "first"));
	ASSERT_OK(sfx::getenv("SFX_TEST_ENV", value));
	CPPUNIT_ASSERT(value);
	CPPUNIT_ASSERT_EQUAL(std::string("first"), *value);

	ASSERT_OK(sfx::setenv("SFX_TEST_ENV", "second", false));
	ASSERT_OK(sfx::getenv("SFX_TEST_ENV", value));
	CPPUNIT_ASSERT_EQUAL(std::string("first"), *value);

	ASSERT_OK(sfx::setenv("SFX_TEST_ENV", ""));
	ASSERT_OK(sfx::getenv("SFX_TEST_ENV", value));
	CPPUNIT_ASSERT(value);
	CPPUNIT_ASSERT(value->empty());

	ASSERT_OK(sfx::unsetenv("SFX_TEST_ENV"));
	ASSERT_OK(sfx::getenv("SFX_TEST_ENV", value));
	CPPUNIT_ASSERT(!value);

	ASSERT_ERRNO(EINVAL, sfx::setenv("A=B", "x"));
	ASSERT_ERRNO(EINVAL, sfx::setenv("", "x"));
	ASSERT_ERRNO(EINVAL, sfx::setenv(std::string("A\0B", 3), "x"));
	ASSERT_ERRNO(EINVAL, sfx::unsetenv("A=B"));
}

void system_test::test_rlimit()
{
	sfx::rlimit_pair limits;
	ASSERT_OK(sfx::getrlimit(sfx::resource::nofile, limits));
	CPPUNIT_ASSERT(limits.soft > 0);
	CPPUNIT_ASSERT(limits.hard == sfx::rlim_infinity || limits.soft <= limits.hard);

	// Lowering and restoring the soft limit is always permitted
	sfx::rlimit_pair lowered = limits;
	lowered.soft = 64;
	ASSERT_OK(sfx::setrlimit(sfx::resource::nofile, lowered));

	sfx::rlimit_pair now;
	ASSERT_OK(sfx::getrlimit(sfx::resource::nofile, now));
	ASSERT_EQUAL(rlim_t(64), now.soft);

	ASSERT_OK(sfx::setrlimit(sfx::resource::nofile, limits));

	sfx::rlimit_pair invalid = limits;
	if (invalid.hard != sfx::rlim_infinity) {
		invalid.soft = invalid.hard + 1;
		ASSERT_ERRNO(EINVAL, sfx::setrlimit(sfx::resource::nofile, invalid));
	}
}

void system_test::test_rusage()
{
	// Burn a little CPU
	volatile unsigned long x{};
	for (unsigned long i = 0; i < 10000000; ++i) {
		x = x + i;
	}

	sfx::rusage_info usage;
	ASSERT_OK(sfx::getrusage(sfx::rusage_who::self, usage));
	CPPUNIT_ASSERT(usage.utime().count() + usage.stime().count() > 0);
	CPPUNIT_ASSERT(usage.maxrss() > 0);

	ASSERT_OK(sfx::getrusage(sfx::rusage_who::children, usage));
}

void system_test::test_priority()
{
	int prio{-100};
	ASSERT_OK(sfx::getpriority(sfx::priority_which::process, 0, prio));
	CPPUNIT_ASSERT(prio >= -20 && prio <= 19);

	// Lowering the priority of a child is always permitted
	int status = sfx::test::run_in_child([prio]() {
		int const target = prio < 19 ? prio + 1 : 19;
		if (!sfx::setpriority(sfx::priority_which::process, 0, target)) {
			_exit(1);
		}
		int now{};
		if (!sfx::getpriority(sfx::priority_which::process, 0, now) || now != target) {
			_exit(2);
		}
	});
	CPPUNIT_ASSERT(WIFEXITED(status));
	ASSERT_EQUAL(0, WEXITSTATUS(status));

	ASSERT_ERRNO(ESRCH, sfx::getpriority(sfx::priority_which::process, 0x7ffffff0, prio));
}

void system_test::test_clock()
{
	std::chrono::nanoseconds a{}, b{};
	ASSERT_OK(sfx::clock_gettime(sfx::clock_id::monotonic, a));
	ASSERT_OK(sfx::clock_gettime(sfx::clock_id::monotonic, b));
	CPPUNIT_ASSERT(b >= a);

	std::chrono::nanoseconds now{};
	ASSERT_OK(sfx::clock_gettime(sfx::clock_id::realtime, now));
	// Later than 2020-01-01
	CPPUNIT_ASSERT(now > std::chrono::seconds(1577836800));

	std::chrono::nanoseconds res{};
	ASSERT_OK(sfx::clock_getres(sfx::clock_id::monotonic, res));
	CPPUNIT_ASSERT(res.count() > 0);

	ASSERT_OK(sfx::clock_gettime(sfx::clock_id::process_cputime, a));
	ASSERT_OK(sfx::clock_gettime(sfx::clock_id::thread_cputime, a));

	ASSERT_ERRNO(EINVAL, sfx::clock_gettime(static_cast<sfx::clock_id>(12345), a));
}
