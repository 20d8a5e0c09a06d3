#include "syscall.hpp"
#include "libsafix/mutex.hpp"

namespace sfx {

// pthread mutex calls only fail on misuse, e.g. unlocking a mutex owned by another thread
mutex::mutex(bool recursive)
{
	pthread_mutexattr_t attr;
	check_or_abort("pthread_mutexattr_init", pthread_mutexattr_init(&attr));
	check_or_abort("pthread_mutexattr_settype", pthread_mutexattr_settype(&attr, recursive ? PTHREAD_MUTEX_RECURSIVE : PTHREAD_MUTEX_ERRORCHECK));
	check_or_abort("pthread_mutex_init", pthread_mutex_init(&m_, &attr));
	pthread_mutexattr_destroy(&attr);
}

mutex::~mutex()
{
	pthread_mutex_destroy(&m_);
}

void mutex::lock()
{
	check_or_abort("pthread_mutex_lock", pthread_mutex_lock(&m_));
}

void mutex::unlock()
{
	check_or_abort("pthread_mutex_unlock", pthread_mutex_unlock(&m_));
}

bool mutex::try_lock()
{
	int ret = pthread_mutex_trylock(&m_);
	if (ret == EBUSY) {
		return false;
	}
	check_or_abort("pthread_mutex_trylock", ret);
	return true;
}

}
