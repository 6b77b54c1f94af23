#ifndef SNAPFETCH_MUTEX_HPP
#define SNAPFETCH_MUTEX_HPP

#include "Common.hpp"

#include <pthread.h>

namespace sf
{

struct Mutex
{
  pthread_mutex_t m_Impl;
};

inline void MutexInit(Mutex* self)
{
  if (0 != pthread_mutex_init(&self->m_Impl, nullptr))
    CroakErrno("pthread_mutex_init() failed");
}

inline void MutexDestroy(Mutex* self)
{
  if (0 != pthread_mutex_destroy(&self->m_Impl))
    CroakErrno("pthread_mutex_destroy() failed");
}

inline void MutexLock(Mutex* self)
{
  if (0 != pthread_mutex_lock(&self->m_Impl))
    CroakErrno("pthread_mutex_lock() failed");
}

inline void MutexUnlock(Mutex* self)
{
  if (0 != pthread_mutex_unlock(&self->m_Impl))
    CroakErrno("pthread_mutex_unlock() failed");
}

class MutexScope
{
  Mutex* m_Mutex;

public:
  explicit MutexScope(Mutex* mutex) : m_Mutex(mutex)
  {
    MutexLock(m_Mutex);
  }

  ~MutexScope()
  {
    MutexUnlock(m_Mutex);
  }

private:
  MutexScope(const MutexScope&);
  MutexScope& operator=(const MutexScope&);
};

}

#endif
