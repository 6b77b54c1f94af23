#include "SignalHandler.hpp"
#include "Common.hpp"
#include "Mutex.hpp"
#include "Thread.hpp"
#include "ConditionVar.hpp"

#include <stdio.h>
#include <signal.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/time.h>

namespace sf
{

static const char*        s_SignalReason;
static Mutex              s_SignalMutex = { PTHREAD_MUTEX_INITIALIZER };
static ConditionVariable *s_SignalCond;
static ConditionVariable  s_SleepCond = { PTHREAD_COND_INITIALIZER };

const char* SignalGetReason(void)
{
  MutexScope lock(&s_SignalMutex);
  return s_SignalReason;
}

void SignalSet(const char* reason)
{
  MutexLock(&s_SignalMutex);

  s_SignalReason = reason;

  if (ConditionVariable* cvar = s_SignalCond)
    CondBroadcast(cvar);

  CondBroadcast(&s_SleepCond);

  MutexUnlock(&s_SignalMutex);
}

void SignalReset(void)
{
  MutexScope lock(&s_SignalMutex);
  s_SignalReason = nullptr;
}

bool SignalWaitSeconds(int seconds)
{
  struct timeval now;
  if (0 != gettimeofday(&now, nullptr))
    CroakErrno("gettimeofday failed");

  struct timespec deadline;
  deadline.tv_sec  = now.tv_sec + seconds;
  deadline.tv_nsec = long(now.tv_usec) * 1000;

  MutexScope lock(&s_SignalMutex);

  while (nullptr == s_SignalReason)
  {
    if (!CondWaitUntil(&s_SleepCond, &s_SignalMutex, deadline))
      break;
  }

  return nullptr == s_SignalReason;
}

static void InitSignalSet(sigset_t* sigs)
{
  sigemptyset(sigs);
  sigaddset(sigs, SIGINT);
  sigaddset(sigs, SIGTERM);
  sigaddset(sigs, SIGQUIT);
}

static void* PosixSignalHandlerThread(void *arg)
{
  (void)arg; // unused

  sigset_t sigs;
  InitSignalSet(&sigs);

  for (;;)
  {
    int sig;
    if (0 != sigwait(&sigs, &sig))
      CroakErrno("sigwait() failed");

    const char *reason = "unknown";
    switch (sig)
    {
      case SIGINT:  reason = "SIGINT";  break;
      case SIGTERM: reason = "SIGTERM"; break;
      case SIGQUIT: reason = "SIGQUIT"; break;
    }

    if (SignalGetReason())
    {
      // Second signal while still shutting down: give up on cleanup.
      static const char msg[] = "interrupted again, exiting immediately\n";
      ssize_t ignored = write(STDERR_FILENO, msg, sizeof msg - 1);
      (void) ignored;
      _exit(4);
    }

    Log(kWarning, "received %s, stopping", reason);
    SignalSet(reason);
  }

  return nullptr;
}

void SignalHandlerInit()
{
  SignalBlockThread(true);

  ThreadStartDetached(PosixSignalHandlerThread, nullptr, "sf-signals");
}

void SignalHandlerSetCondition(ConditionVariable *cvar)
{
  MutexScope lock(&s_SignalMutex);
  s_SignalCond = cvar;
}

void SignalBlockThread(bool block)
{
  sigset_t sigs;
  InitSignalSet(&sigs);
  if (0 != pthread_sigmask(block ? SIG_BLOCK : SIG_UNBLOCK, &sigs, 0))
    CroakErrno("pthread_sigmask failed");
}

}
