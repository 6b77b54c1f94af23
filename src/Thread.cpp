#include "Thread.hpp"

#include <errno.h>
#include <string.h>

namespace sf
{

static void SetThreadName(pthread_t thread, const char* name)
{
  // Linux limits thread names to 15 characters plus the terminator.
  char truncated[16];
  CopyString(truncated, sizeof truncated, name);

#if defined(SNAPFETCH_LINUX)
  pthread_setname_np(thread, truncated);
#else
  // Other platforms can only name the calling thread; leave them unnamed.
  (void) thread;
#endif
}

ThreadId ThreadStart(ThreadRoutine routine, void *param, const char* name)
{
  pthread_t thread;
  int rc = pthread_create(&thread, nullptr, routine, param);
  if (0 != rc)
  {
    errno = rc;
    CroakErrno("couldn't start thread %s", name);
  }

  SetThreadName(thread, name);
  Log(kSpam, "started thread %s", name);
  return thread;
}

void ThreadStartDetached(ThreadRoutine routine, void *param, const char* name)
{
  ThreadId thread = ThreadStart(routine, param, name);
  pthread_detach(thread);
}

void ThreadJoin(ThreadId thread_id)
{
  void* result;
  int rc = pthread_join(thread_id, &result);
  if (0 != rc)
  {
    errno = rc;
    CroakErrno("pthread_join() failed");
  }
}

}
