#include "../lib/libsafix/sched.hpp"

#include "test_utils.hpp"

class sched_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(sched_test);
	CPPUNIT_TEST(test_cpu_set);
	CPPUNIT_TEST(test_affinity);
	CPPUNIT_TEST(test_yield);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_cpu_set();
	void test_affinity();
	void test_yield();
};

CPPUNIT_TEST_SUITE_REGISTRATION(sched_test);

void sched_test::test_cpu_set()
{
	sfx::cpu_set set;
	CPPUNIT_ASSERT(set.empty());
	ASSERT_EQUAL(size_t(0), set.count());

	for (unsigned int cpu : {0u, 3u, 64u, sfx::cpu_set::max_cpus - 1}) {
		ASSERT_OK(set.add(cpu));
	}
	ASSERT_EQUAL(size_t(4), set.count());
	CPPUNIT_ASSERT(set.contains(3));
	CPPUNIT_ASSERT(!set.contains(4));
	CPPUNIT_ASSERT(set.cpus() == (std::vector<unsigned int>{0, 3, 64, sfx::cpu_set::max_cpus - 1}));

	// Out of range
	ASSERT_ERRNO(EINVAL, set.add(sfx::cpu_set::max_cpus));
	CPPUNIT_ASSERT(!set.contains(sfx::cpu_set::max_cpus));
	set.remove(sfx::cpu_set::max_cpus);
	ASSERT_EQUAL(size_t(4), set.count());

	set.remove(3);
	set.remove(3);
	CPPUNIT_ASSERT(!set.contains(3));
	ASSERT_EQUAL(size_t(3), set.count());

	sfx::cpu_set other;
	CPPUNIT_ASSERT(other != set);
	other = set;
	CPPUNIT_ASSERT(other == set);

	set.clear();
	CPPUNIT_ASSERT(set.empty());
	CPPUNIT_ASSERT(set.cpus().empty());
}

void sched_test::test_affinity()
{
	sfx::cpu_set allowed;
	auto r = sfx::sched_getaffinity(0, allowed);
	if (!r && r.raw_ == ENOSYS) {
		return;
	}
	ASSERT_OK(r);
	CPPUNIT_ASSERT(allowed.count() >= 1);

	unsigned int cpu{};
	r = sfx::sched_getcpu(cpu);
	if (r) {
		CPPUNIT_ASSERT(allowed.contains(cpu));
	}
	else {
		ASSERT_EQUAL(ENOSYS, r.raw_);
	}

	// Setting the current mask again changes nothing
	ASSERT_OK(sfx::sched_setaffinity(0, allowed));

	// Pinning to a single CPU must not affect the test runner
	unsigned int const first = allowed.cpus().front();
	int status = sfx::test::run_in_child([first] {
		sfx::cpu_set one;
		if (!one.add(first) || !sfx::sched_setaffinity(0, one)) {
			_exit(1);
		}

		sfx::cpu_set got;
		if (!sfx::sched_getaffinity(0, got) || got != one) {
			_exit(2);
		}

		unsigned int now{};
		auto r = sfx::sched_getcpu(now);
		if (r && now != first) {
			_exit(3);
		}
	});
	CPPUNIT_ASSERT(WIFEXITED(status));
	ASSERT_EQUAL(0, WEXITSTATUS(status));

	// No CPU at all
	ASSERT_ERRNO(EINVAL, sfx::sched_setaffinity(0, sfx::cpu_set()));

	sfx::cpu_set unchanged = allowed;
	// Beyond any pid_max
	ASSERT_ERRNO(ESRCH, sfx::sched_getaffinity(pid_t(0x7fffffff), unchanged));
	CPPUNIT_ASSERT(unchanged == allowed);
}

void sched_test::test_yield()
{
	for (int i = 0; i < 10; ++i) {
		sfx::sched_yield();
	}
}
