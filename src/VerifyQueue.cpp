#include "VerifyQueue.hpp"
#include "ChecksumCache.hpp"
#include "MemAllocHeap.hpp"
#include "SignalHandler.hpp"
#include "Stats.hpp"
#include "ValidationState.hpp"

#include <stdio.h>
#include <string.h>

namespace sf
{
  namespace VerifyResult
  {
    const char* Names[Enum::kCount] =
    {
      "all files valid",
      "checksum validation failed",
      "verification interrupted",
      "verification state could not be saved"
    };
  }

  static bool ShouldStopTaking(VerifyQueue* queue)
  {
    return queue->m_QuitSignalled || nullptr != SignalGetReason();
  }

  static bool PassDone(VerifyQueue* queue)
  {
    if (queue->m_InFlightCount > 0)
      return false;

    return queue->m_NextIndex == queue->m_RequestCount || nullptr != SignalGetReason();
  }

  static void VerifyLoop(VerifyThreadState* thread_state)
  {
    VerifyQueue       *queue = thread_state->m_Queue;
    ConditionVariable *cv    = &queue->m_WorkAvailable;
    Mutex             *mutex = &queue->m_Lock;
    const bool         main_thread = 0 == thread_state->m_ThreadIndex;

    MutexLock(mutex);

    for (;;)
    {
      if (queue->m_QuitSignalled)
        break;

      if (!ShouldStopTaking(queue) && queue->m_NextIndex < queue->m_RequestCount)
      {
        int32_t index = queue->m_NextIndex++;
        ++queue->m_InFlightCount;

        MutexUnlock(mutex);

        VerifyFile(queue->m_Config.m_Cache, &queue->m_Requests[index], &queue->m_Outcomes[index]);

        MutexLock(mutex);

        --queue->m_InFlightCount;
        ++queue->m_CompletedCount;

        // Thread 0 may be sleeping until the pass drains.
        if (PassDone(queue))
          CondBroadcast(cv);

        continue;
      }

      if (main_thread && PassDone(queue))
        break;

      CondWait(cv, mutex);
    }

    MutexUnlock(mutex);

    Log(kSpam, "verify thread %d leaving loop", thread_state->m_ThreadIndex);
  }

  static ThreadRoutineReturnType VerifyThreadRoutine(void* param)
  {
    VerifyThreadState *thread_state = static_cast<VerifyThreadState*>(param);

    // Workers stay alive between passes until the queue is destroyed.
    VerifyLoop(thread_state);

    return 0;
  }

  void VerifyQueueInit(VerifyQueue* queue, const VerifyQueueConfig* config)
  {
    MutexInit(&queue->m_Lock);
    CondInit(&queue->m_WorkAvailable);

    queue->m_Config         = *config;
    queue->m_Requests       = nullptr;
    queue->m_Outcomes       = nullptr;
    queue->m_RequestCount   = 0;
    queue->m_NextIndex      = 0;
    queue->m_InFlightCount  = 0;
    queue->m_CompletedCount = 0;
    queue->m_QuitSignalled  = false;

    if (queue->m_Config.m_ThreadCount < 1)
      queue->m_Config.m_ThreadCount = 1;

    if (queue->m_Config.m_ThreadCount > kMaxVerifyThreads)
    {
      Log(kWarning, "too many verification threads (%d) - clamping to %d",
          queue->m_Config.m_ThreadCount, kMaxVerifyThreads);

      queue->m_Config.m_ThreadCount = kMaxVerifyThreads;
    }

    SignalHandlerSetCondition(&queue->m_WorkAvailable);

    for (int i = 0, thread_count = queue->m_Config.m_ThreadCount; i < thread_count; ++i)
    {
      VerifyThreadState* thread_state = &queue->m_ThreadState[i];
      thread_state->m_ThreadIndex = i;
      thread_state->m_Queue       = queue;

      if (i > 0)
      {
        Log(kSpam, "starting verify thread %d", i);
        char name[16];
        snprintf(name, sizeof name, "sf-verify-%d", i);
        queue->m_Threads[i] = ThreadStart(VerifyThreadRoutine, thread_state, name);
      }
    }

    Log(kDebug, "verify queue initialized with %d threads", queue->m_Config.m_ThreadCount);
  }

  void VerifyQueueDestroy(VerifyQueue* queue)
  {
    Log(kDebug, "destroying verify queue");

    MutexLock(&queue->m_Lock);
    queue->m_QuitSignalled = true;
    MutexUnlock(&queue->m_Lock);

    CondBroadcast(&queue->m_WorkAvailable);

    for (int i = 1, thread_count = queue->m_Config.m_ThreadCount; i < thread_count; ++i)
    {
      Log(kSpam, "joining with verify thread %d", i);
      ThreadJoin(queue->m_Threads[i]);
    }

    SignalHandlerSetCondition(nullptr);

    CondDestroy(&queue->m_WorkAvailable);
    MutexDestroy(&queue->m_Lock);
  }

  VerifyResult::Enum VerifyQueueRun(VerifyQueue* queue, const VerifyRequest* requests, int count, VerifyOutcome* outcomes)
  {
    // Make sure none of the worker threads see a half set up pass.
    MutexLock(&queue->m_Lock);

    queue->m_Requests       = requests;
    queue->m_Outcomes       = outcomes;
    queue->m_RequestCount   = count;
    queue->m_NextIndex      = 0;
    queue->m_InFlightCount  = 0;
    queue->m_CompletedCount = 0;

    MutexUnlock(&queue->m_Lock);

    CondBroadcast(&queue->m_WorkAvailable);

    // This thread is thread 0.
    VerifyLoop(&queue->m_ThreadState[0]);

    MutexLock(&queue->m_Lock);
    int completed = queue->m_CompletedCount;
    queue->m_Requests     = nullptr;
    queue->m_Outcomes     = nullptr;
    queue->m_RequestCount = 0;
    queue->m_NextIndex    = 0;
    MutexUnlock(&queue->m_Lock);

    if (completed != count)
      return VerifyResult::kInterrupted;

    for (int i = 0; i < count; ++i)
    {
      if (VerifyStatus::kSuccess != outcomes[i].m_Status)
        return VerifyResult::kSomeFailed;
    }

    return VerifyResult::kAllValid;
  }

  VerifyResult::Enum VerifyAll(
      VerifyQueue*            queue,
      const ValidationState*  state,
      const VerifyRequest*    requests,
      int                     count,
      VerifyOutcome*          outcomes,
      VerifyPassSummary*      summary)
  {
    MemAllocHeap* heap = queue->m_Config.m_Heap;

    memset(summary, 0, sizeof *summary);
    summary->m_TotalCount = count;

    if (!FailureLedgerRemove(state) || !ValidationMarkerRemove(state))
      return VerifyResult::kStateError;

    Log(kInfo, "Verifying %d files using %d threads", count, queue->m_Config.m_ThreadCount);

    VerifyResult::Enum result = VerifyQueueRun(queue, requests, count, outcomes);

    // Keep whatever was hashed, even when interrupted.
    ChecksumCacheSave(queue->m_Config.m_Cache);

    if (VerifyResult::kInterrupted == result)
    {
      Log(kWarning, "verification interrupted (%s)", SignalGetReason());
      return result;
    }

    for (int i = 0; i < count; ++i)
    {
      const VerifyOutcome& outcome = outcomes[i];

      if (outcome.m_CacheHit)
        ++summary->m_CacheHitCount;

      switch (outcome.m_Status)
      {
        case VerifyStatus::kSuccess:  ++summary->m_PassedCount;   break;
        case VerifyStatus::kMismatch: ++summary->m_MismatchCount; break;
        case VerifyStatus::kIoError:  ++summary->m_IoErrorCount;  break;
        default: break;
      }
    }

    Log(kInfo, "Verified %d files: %d ok, %d mismatched, %d unreadable (%d cached)",
        summary->m_TotalCount, summary->m_PassedCount, summary->m_MismatchCount,
        summary->m_IoErrorCount, summary->m_CacheHitCount);

    if (VerifyResult::kAllValid == result)
    {
      if (!ValidationMarkerWrite(state, outcomes, count, heap))
        return VerifyResult::kStateError;
    }
    else
    {
      if (!FailureLedgerWrite(state, outcomes, count, heap))
        return VerifyResult::kStateError;
    }

    return result;
  }
}
