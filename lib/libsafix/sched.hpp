#ifndef LIBSAFIX_SCHED_HEADER
#define LIBSAFIX_SCHED_HEADER

#include "error.hpp"

#include <bitset>
#include <vector>

#include <sys/types.h>

/** \file
 * \brief Yielding the processor and CPU affinity
 */

namespace sfx {

/// Gives up the processor to other runnable threads. Cannot fail.
void SFX_PUBLIC_SYMBOL sched_yield();

/** \brief A set of CPUs, as used for affinity masks.
 *
 * Holds CPU numbers from 0 to max_cpus - 1.
 */
class SFX_PUBLIC_SYMBOL cpu_set final
{
public:
	static constexpr unsigned int max_cpus = 1024;

	/// Creates an empty set
	cpu_set() = default;

	/// Fails with EINVAL if cpu is not below max_cpus
	result add(unsigned int cpu);

	/// Does nothing if cpu is not below max_cpus
	void remove(unsigned int cpu);

	/// False if cpu is not below max_cpus
	bool contains(unsigned int cpu) const;

	void clear() { bits_.reset(); }

	/// Number of CPUs in the set
	size_t count() const { return bits_.count(); }

	bool empty() const { return bits_.none(); }

	/// The CPUs in the set in ascending order
	std::vector<unsigned int> cpus() const;

	std::bitset<max_cpus> const& native() const { return bits_; }
	std::bitset<max_cpus>& native() { return bits_; }

	bool operator==(cpu_set const& op) const { return bits_ == op.bits_; }
	bool operator!=(cpu_set const& op) const { return bits_ != op.bits_; }

private:
	std::bitset<max_cpus> bits_;
};

/** \brief Restricts the thread with the given ID to the CPUs in the set.
 *
 * Pass 0 for the calling thread. Fails with ENOSYS where unsupported.
 */
result SFX_PUBLIC_SYMBOL sched_setaffinity(pid_t pid, cpu_set const& set);

/// Gets the CPUs the thread may run on. Pass 0 for the calling thread. Fails with ENOSYS where unsupported.
result SFX_PUBLIC_SYMBOL sched_getaffinity(pid_t pid, cpu_set& out);

/// Gets the CPU the calling thread is currently running on. Fails with ENOSYS where unsupported.
result SFX_PUBLIC_SYMBOL sched_getcpu(unsigned int& cpu);

}

#endif
