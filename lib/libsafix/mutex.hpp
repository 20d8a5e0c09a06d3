#ifndef LIBSAFIX_MUTEX_HEADER
#define LIBSAFIX_MUTEX_HEADER

/** \file
 * \brief Thread synchronization primitives: mutex and scoped_lock
 */
#include "libsafix.hpp"

#include <pthread.h>

namespace sfx {

/**
 * \brief Lean replacement for std::(recursive_)mutex
 *
 * Unlike std::mutex, it can be locked from pthread_atfork handlers.
 *
 * A non-recursive mutex is error checking. Misuse such as relocking it from
 * the owning thread or unlocking it from another thread aborts the process.
 */
class SFX_PUBLIC_SYMBOL mutex final
{
public:
	explicit mutex(bool recursive = true);
	~mutex();

	mutex(mutex const&) = delete;
	mutex& operator=(mutex const&) = delete;

	/// Beware, manual locking isn't exception safe, use scoped_lock
	void lock();

	/// Beware, manual locking isn't exception safe, use scoped_lock
	void unlock();

	/// Beware, manual locking isn't exception safe
	bool try_lock();

private:
	pthread_mutex_t m_;
};

/**
 * \brief A simple scoped lock.
 *
 * Locks the mutex on construction, unlocks it on destruction.
 */
class SFX_PUBLIC_SYMBOL scoped_lock final
{
public:
	explicit scoped_lock(mutex& m)
		: m_(&m)
	{
		m_->lock();
	}

	~scoped_lock()
	{
		if (locked_) {
			m_->unlock();
		}
	}

	scoped_lock(scoped_lock const&) = delete;
	scoped_lock& operator=(scoped_lock const&) = delete;

	/// Releases the lock before the end of the scope
	void unlock()
	{
		if (locked_) {
			locked_ = false;
			m_->unlock();
		}
	}

private:
	mutex* const m_;
	bool locked_{true};
};

}

#endif
