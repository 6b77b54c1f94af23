#ifndef SNAPFETCH_CONDITION_VAR_HPP
#define SNAPFETCH_CONDITION_VAR_HPP

#include "Common.hpp"
#include "Mutex.hpp"

#include <errno.h>
#include <pthread.h>
#include <time.h>

namespace sf
{

struct ConditionVariable
{
  pthread_cond_t m_Impl;
};

inline void CondInit(ConditionVariable* var)
{
  if (0 != pthread_cond_init(&var->m_Impl, nullptr))
    CroakErrno("pthread_cond_init() failed");
}

inline void CondDestroy(ConditionVariable* var)
{
  if (0 != pthread_cond_destroy(&var->m_Impl))
    CroakErrno("pthread_cond_destroy() failed");
}

inline void CondWait(ConditionVariable* var, Mutex* mutex)
{
  if (0 != pthread_cond_wait(&var->m_Impl, &mutex->m_Impl))
    CroakErrno("pthread_cond_wait() failed");
}

// Wait until woken or until the absolute realtime `deadline`. Returns false
// once the deadline has passed. Wakeups may be spurious, so callers recheck
// their predicate either way.
inline bool CondWaitUntil(ConditionVariable* var, Mutex* mutex, const struct timespec& deadline)
{
  int rc = pthread_cond_timedwait(&var->m_Impl, &mutex->m_Impl, &deadline);
  if (ETIMEDOUT == rc)
    return false;
  if (0 != rc)
  {
    errno = rc;
    CroakErrno("pthread_cond_timedwait() failed");
  }
  return true;
}

inline void CondBroadcast(ConditionVariable* var)
{
  if (0 != pthread_cond_broadcast(&var->m_Impl))
    CroakErrno("pthread_cond_broadcast() failed");
}

}

#endif
