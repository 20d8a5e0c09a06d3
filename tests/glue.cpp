#include "../lib/libsafix/glue/unix.hpp"
#include "../lib/libsafix/file_desc.hpp"
#include "../lib/libsafix/mutex.hpp"
#include "../lib/libsafix/spawn.hpp"
#include "../lib/libsafix/unistd.hpp"

#include "test_utils.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

class glue_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(glue_test);
	CPPUNIT_TEST(test_pipe);
	CPPUNIT_TEST(test_socketpair);
	CPPUNIT_TEST(test_sigpipe_disposition);
	CPPUNIT_TEST(test_flags);
	CPPUNIT_TEST(test_forkblock);
	CPPUNIT_TEST(test_mutex);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_pipe();
	void test_socketpair();
	void test_sigpipe_disposition();
	void test_flags();
	void test_forkblock();
	void test_mutex();
};

CPPUNIT_TEST_SUITE_REGISTRATION(glue_test);

void glue_test::test_pipe()
{
	int fds[2];
	ASSERT_EQUAL(0, sfx::create_pipe(fds));
	sfx::file_desc r(fds[0]);
	sfx::file_desc w(fds[1]);

	CPPUNIT_ASSERT(fcntl(fds[0], F_GETFD) & FD_CLOEXEC);
	CPPUNIT_ASSERT(fcntl(fds[1], F_GETFD) & FD_CLOEXEC);

	// The test runner opted in with disable_sigpipe
	r.reset();
	auto res = w.write("x", 1);
	CPPUNIT_ASSERT(!res);
	ASSERT_EQUAL(EPIPE, res.raw_);
}

void glue_test::test_socketpair()
{
	int fds[2];
	ASSERT_EQUAL(0, sfx::create_socketpair(fds, SOCK_STREAM));
	sfx::file_desc a(fds[0]);
	sfx::file_desc b(fds[1]);

	CPPUNIT_ASSERT(fcntl(fds[0], F_GETFD) & FD_CLOEXEC);
	CPPUNIT_ASSERT(fcntl(fds[1], F_GETFD) & FD_CLOEXEC);

	ASSERT_OK(a.write_all("ab", 2));
	char buf[2];
	ASSERT_OK(b.read_exact(buf, 2));
	CPPUNIT_ASSERT_EQUAL(std::string("ab"), std::string(buf, 2));

	int bad[2]{5, 6};
	ASSERT_EQUAL(EINVAL, sfx::create_socketpair(bad, 12345));
	ASSERT_EQUAL(-1, bad[0]);
	ASSERT_EQUAL(-1, bad[1]);
}

namespace {
bool sigpipe_is_default()
{
	struct sigaction sa{};
	return !sigaction(SIGPIPE, nullptr, &sa) && sa.sa_handler == SIG_DFL;
}
}

void glue_test::test_sigpipe_disposition()
{
	// The runner ignores SIGPIPE, start the child from the default disposition
	int status = sfx::test::run_in_child([] {
		if (!sfx::default_signal(SIGPIPE)) {
			_exit(1);
		}

		sfx::file_desc r, w;
		if (!sfx::pipe_cloexec(r, w) || !sigpipe_is_default()) {
			_exit(2);
		}

		int fds[2];
		if (sfx::create_pipe(fds) || !sigpipe_is_default()) {
			_exit(3);
		}
		::close(fds[0]);
		::close(fds[1]);

		if (sfx::create_socketpair(fds, SOCK_STREAM) || !sigpipe_is_default()) {
			_exit(4);
		}
		::close(fds[0]);
		::close(fds[1]);

#if SFX_LINUX
		// A spawned program must not inherit an ignored SIGPIPE
		sfx::spawn_file_actions actions;
		if (!actions.add_dup2(w.fd(), STDOUT_FILENO)) {
			_exit(5);
		}
		pid_t pid{};
		if (!sfx::spawnp(pid, "sh", &actions, nullptr, sfx::cstring_vec{"sh", "-c", "grep SigIgn: /proc/self/status"})) {
			_exit(6);
		}
		w.close();

		std::string out;
		char buf[256];
		while (true) {
			auto res = r.read(buf, sizeof(buf));
			if (!res || !res.value_) {
				break;
			}
			out.append(buf, res.value_);
		}
		int child_status{};
		if (!sfx::wait_pid(pid, child_status) || sfx::exit_status(child_status) != 0) {
			_exit(7);
		}

		auto pos = out.find(':');
		if (pos == std::string::npos) {
			_exit(8);
		}
		unsigned long long mask = std::strtoull(out.c_str() + pos + 1, nullptr, 16);
		if (mask & (1ull << (SIGPIPE - 1))) {
			_exit(9);
		}
#endif
	});
	CPPUNIT_ASSERT(WIFEXITED(status));
	ASSERT_EQUAL(0, WEXITSTATUS(status));
}

void glue_test::test_flags()
{
	int fds[2];
	ASSERT_EQUAL(0, sfx::create_pipe(fds));
	sfx::file_desc r(fds[0]);
	sfx::file_desc w(fds[1]);

	ASSERT_EQUAL(0, sfx::set_cloexec(fds[0], false));
	CPPUNIT_ASSERT(!(fcntl(fds[0], F_GETFD) & FD_CLOEXEC));
	ASSERT_EQUAL(0, sfx::set_cloexec(fds[0]));
	CPPUNIT_ASSERT(fcntl(fds[0], F_GETFD) & FD_CLOEXEC);

	ASSERT_EQUAL(0, sfx::set_nonblocking(fds[0]));
	CPPUNIT_ASSERT(fcntl(fds[0], F_GETFL) & O_NONBLOCK);
	ASSERT_EQUAL(0, sfx::set_nonblocking(fds[0], false));
	CPPUNIT_ASSERT(!(fcntl(fds[0], F_GETFL) & O_NONBLOCK));

	ASSERT_EQUAL(EBADF, sfx::set_cloexec(-1));
	ASSERT_EQUAL(EBADF, sfx::set_nonblocking(-1));
}

void glue_test::test_forkblock()
{
	// Another thread cannot create a forkblock while one is held
	std::atomic<bool> entered{};
	std::thread t;
	{
		sfx::forkblock b;
		t = std::thread([&entered]() {
			sfx::forkblock inner;
			entered = true;
		});
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		CPPUNIT_ASSERT(!entered);
	}
	t.join();
	CPPUNIT_ASSERT(entered);

	// Blocks nest within a thread
	{
		sfx::forkblock a;
		sfx::forkblock b;
	}
}

void glue_test::test_mutex()
{
	sfx::mutex m;
	m.lock();
	// Recursive by default
	CPPUNIT_ASSERT(m.try_lock());
	m.unlock();
	m.unlock();

	sfx::mutex plain(false);
	{
		sfx::scoped_lock l(plain);

		bool other_got_it{true};
		std::thread t([&]() {
			other_got_it = plain.try_lock();
			if (other_got_it) {
				plain.unlock();
			}
		});
		t.join();
		CPPUNIT_ASSERT(!other_got_it);

		l.unlock();

		t = std::thread([&]() {
			other_got_it = plain.try_lock();
			if (other_got_it) {
				plain.unlock();
			}
		});
		t.join();
		CPPUNIT_ASSERT(other_got_it);
	}

	// Unlocking a mutex that is not held
	int status = sfx::test::run_in_child([&] {
		::close(STDERR_FILENO);
		plain.unlock();
	});
	CPPUNIT_ASSERT(WIFSIGNALED(status));
	ASSERT_EQUAL(SIGABRT, WTERMSIG(status));

	// Counter protected by the mutex
	int counter{};
	std::vector<std::thread> threads;
	for (int i = 0; i < 4; ++i) {
		threads.emplace_back([&]() {
			for (int j = 0; j < 10000; ++j) {
				sfx::scoped_lock l(m);
				++counter;
			}
		});
	}
	for (auto& t : threads) {
		t.join();
	}
	ASSERT_EQUAL(40000, counter);
}
