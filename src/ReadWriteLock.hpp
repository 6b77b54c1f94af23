#ifndef SNAPFETCH_READWRITELOCK_HPP
#define SNAPFETCH_READWRITELOCK_HPP

#include "Common.hpp"

#include <pthread.h>

namespace sf
{

// Many readers or one writer. Used where lookups vastly outnumber updates.
struct ReadWriteLock
{
  pthread_rwlock_t m_Impl;
};

inline void ReadWriteLockInit(ReadWriteLock* self)
{
  if (0 != pthread_rwlock_init(&self->m_Impl, nullptr))
    CroakErrno("pthread_rwlock_init() failed");
}

inline void ReadWriteLockDestroy(ReadWriteLock* self)
{
  if (0 != pthread_rwlock_destroy(&self->m_Impl))
    CroakErrno("pthread_rwlock_destroy() failed");
}

class ReadLockScope
{
  ReadWriteLock* m_Lock;

public:
  explicit ReadLockScope(ReadWriteLock* lock) : m_Lock(lock)
  {
    if (0 != pthread_rwlock_rdlock(&m_Lock->m_Impl))
      CroakErrno("pthread_rwlock_rdlock() failed");
  }

  ~ReadLockScope()
  {
    pthread_rwlock_unlock(&m_Lock->m_Impl);
  }

private:
  ReadLockScope(const ReadLockScope&);
  ReadLockScope& operator=(const ReadLockScope&);
};

class WriteLockScope
{
  ReadWriteLock* m_Lock;

public:
  explicit WriteLockScope(ReadWriteLock* lock) : m_Lock(lock)
  {
    if (0 != pthread_rwlock_wrlock(&m_Lock->m_Impl))
      CroakErrno("pthread_rwlock_wrlock() failed");
  }

  ~WriteLockScope()
  {
    pthread_rwlock_unlock(&m_Lock->m_Impl);
  }

private:
  WriteLockScope(const WriteLockScope&);
  WriteLockScope& operator=(const WriteLockScope&);
};

}

#endif
