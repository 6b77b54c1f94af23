#ifndef SNAPFETCH_VERIFYQUEUE_HPP
#define SNAPFETCH_VERIFYQUEUE_HPP

#include "Common.hpp"
#include "Mutex.hpp"
#include "ConditionVar.hpp"
#include "Thread.hpp"
#include "Verifier.hpp"

namespace sf
{
  struct MemAllocHeap;
  struct ChecksumCache;
  struct ValidationState;

  enum
  {
    kMaxVerifyThreads = 64
  };

  struct VerifyQueueConfig
  {
    MemAllocHeap   *m_Heap;
    int             m_ThreadCount;
    ChecksumCache  *m_Cache;
  };

  struct VerifyQueue;

  struct VerifyThreadState
  {
    int               m_ThreadIndex;
    VerifyQueue*      m_Queue;
  };

  // Fixed pool of verification threads. The thread calling VerifyQueueRun()
  // works as thread 0, so a pool of N threads starts N-1 extra threads.
  struct VerifyQueue
  {
    Mutex                m_Lock;
    ConditionVariable    m_WorkAvailable;
    VerifyQueueConfig    m_Config;
    const VerifyRequest *m_Requests;
    VerifyOutcome       *m_Outcomes;
    int32_t              m_RequestCount;
    int32_t              m_NextIndex;
    int32_t              m_InFlightCount;
    int32_t              m_CompletedCount;
    ThreadId             m_Threads[kMaxVerifyThreads];
    VerifyThreadState    m_ThreadState[kMaxVerifyThreads];
    bool                 m_QuitSignalled;
  };

  namespace VerifyResult
  {
    enum Enum
    {
      kAllValid    = 0, // Every file matched its checksum
      kSomeFailed  = 1, // At least one mismatch or unreadable file
      kInterrupted = 2, // Stopped by a signal before every file was checked
      kStateError  = 3, // Verification finished but its result couldn't be persisted
      kCount
    };

    extern const char* Names[Enum::kCount];
  }

  struct VerifyPassSummary
  {
    int m_TotalCount;
    int m_PassedCount;
    int m_MismatchCount;
    int m_IoErrorCount;
    int m_CacheHitCount;
  };

  void VerifyQueueInit(VerifyQueue* queue, const VerifyQueueConfig* config);

  // Verify every request, writing outcomes[i] for requests[i]. Blocks until
  // all requests are done; an interrupt stops the pass early, leaving the
  // unvisited outcomes untouched.
  VerifyResult::Enum VerifyQueueRun(VerifyQueue* queue, const VerifyRequest* requests, int count, VerifyOutcome* outcomes);

  void VerifyQueueDestroy(VerifyQueue* queue);

  // One full verification pass with its persisted effects: the ledger and
  // marker are cleared first, then either the marker is created (everything
  // passed) or the ledger lists the failures. The checksum cache is saved at
  // the end either way.
  VerifyResult::Enum VerifyAll(
      VerifyQueue*            queue,
      const ValidationState*  state,
      const VerifyRequest*    requests,
      int                     count,
      VerifyOutcome*          outcomes,
      VerifyPassSummary*      summary_out);
}

#endif
