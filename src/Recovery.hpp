#ifndef SNAPFETCH_RECOVERY_HPP
#define SNAPFETCH_RECOVERY_HPP

#include "Common.hpp"
#include "VerifyQueue.hpp"

namespace sf
{
  struct MemAllocHeap;
  struct Manifest;
  struct ValidationState;
  struct FailureLedger;
  struct DownloaderConfig;

  namespace RecoveryResult
  {
    enum Enum
    {
      kRecovered        = 0,
      kExhausted        = 1, // Still failing after the last attempt
      kInterrupted      = 2,
      kUnknownFile      = 3, // Ledger names a file the manifest doesn't have
      kStateError       = 4, // Ledger or marker couldn't be read or written
      kCount
    };

    extern const char* Names[kCount];
  }

  struct RecoveryContext
  {
    MemAllocHeap           *m_Heap;
    const Manifest         *m_Manifest;
    const ValidationState  *m_State;
    VerifyQueue            *m_Queue;
    const DownloaderConfig *m_Downloader;
    int                     m_MaxAttempts;
    int                     m_RetryDelaySeconds;
  };

  // Verify every manifest entry with VerifyAll().
  VerifyResult::Enum VerifyManifest(
      VerifyQueue*           queue,
      const ValidationState* state,
      const Manifest*        manifest,
      MemAllocHeap*          heap,
      VerifyPassSummary*     summary_out);

  // Repair the files listed in `ledger`: delete them, download just those
  // files again, verify, and repeat up to m_MaxAttempts times. When attempts
  // run out the files still failing are deleted and their ledger is kept.
  RecoveryResult::Enum RecoverFailures(const RecoveryContext* ctx, const FailureLedger* ledger, int* attempts_out);
}

#endif
