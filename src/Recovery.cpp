#include "Recovery.hpp"
#include "ChecksumCache.hpp"
#include "Downloader.hpp"
#include "Manifest.hpp"
#include "MemAllocHeap.hpp"
#include "SignalHandler.hpp"
#include "ValidationState.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>

namespace sf
{

namespace RecoveryResult
{
  const char* Names[kCount] =
  {
    "recovered",
    "checksum validation exhausted",
    "recovery interrupted",
    "failure ledger doesn't match manifest",
    "validation state error"
  };
}

VerifyResult::Enum VerifyManifest(
    VerifyQueue*           queue,
    const ValidationState* state,
    const Manifest*        manifest,
    MemAllocHeap*          heap,
    VerifyPassSummary*     summary_out)
{
  const int count = ManifestEntryCount(manifest);

  VerifyRequest* requests = HeapAllocateArray<VerifyRequest>(heap, count);
  VerifyOutcome* outcomes = HeapAllocateArrayZeroed<VerifyOutcome>(heap, count);

  for (int i = 0; i < count; ++i)
  {
    requests[i].m_Filename         = manifest->m_Entries[i].m_Filename;
    requests[i].m_ExpectedChecksum = manifest->m_Entries[i].m_Checksum;
  }

  VerifyResult::Enum result = VerifyAll(queue, state, requests, count, outcomes, summary_out);

  HeapFree(heap, outcomes);
  HeapFree(heap, requests);

  return result;
}

static void DeletePart(const RecoveryContext* ctx, const char* filename)
{
  ChecksumCacheInvalidate(ctx->m_Queue->m_Config.m_Cache, filename);

  char control[kMaxPathLength];
  snprintf(control, sizeof control, "%s.aria2", filename);

  if (!RemoveFile(filename))
    Log(kWarning, "couldn't remove %s: %s", filename, strerror(errno));
  if (!RemoveFile(control))
    Log(kWarning, "couldn't remove %s: %s", control, strerror(errno));
}

// Resolve ledger entries to manifest entries. Returns false if any filename is
// unknown.
static bool ResolveLedger(const RecoveryContext* ctx, const FailureLedger* ledger, Buffer<DownloadRequest>* requests)
{
  BufferClear(requests);

  for (const LedgerEntry& entry : ledger->m_Entries)
  {
    const ManifestEntry* manifest_entry = ManifestFind(ctx->m_Manifest, entry.m_Filename);
    if (!manifest_entry)
    {
      Log(kError, "failed file %s is not in the manifest", entry.m_Filename);
      return false;
    }

    DownloadRequest request;
    request.m_Url      = manifest_entry->m_Url;
    request.m_Filename = manifest_entry->m_Filename;
    BufferAppendOne(requests, ctx->m_Heap, request);
  }

  return true;
}

// Returns false if interrupted while waiting.
static bool WaitRetryDelay(int seconds)
{
  if (seconds > 0)
    Log(kInfo, "Retrying in %d seconds", seconds);

  return SignalWaitSeconds(seconds);
}

RecoveryResult::Enum RecoverFailures(const RecoveryContext* ctx, const FailureLedger* ledger, int* attempts_out)
{
  MemAllocHeap* heap = ctx->m_Heap;

  *attempts_out = 0;

  if (0 == ledger->m_Entries.m_Size)
    return RecoveryResult::kRecovered;

  Buffer<DownloadRequest> requests;
  BufferInit(&requests);

  FailureLedger current;
  FailureLedgerInit(&current, heap);

  const FailureLedger* failing = ledger;
  RecoveryResult::Enum result = RecoveryResult::kExhausted;

  for (int attempt = 1; attempt <= ctx->m_MaxAttempts; ++attempt)
  {
    if (!ResolveLedger(ctx, failing, &requests))
    {
      result = RecoveryResult::kUnknownFile;
      break;
    }

    *attempts_out = attempt;

    Log(kInfo, "Recovery attempt %d of %d: %d file%s to fetch again",
        attempt, ctx->m_MaxAttempts, int(requests.m_Size), 1 == requests.m_Size ? "" : "s");

    for (const DownloadRequest& request : requests)
      DeletePart(ctx, request.m_Filename);

    char job_name[32];
    snprintf(job_name, sizeof job_name, "retry-%d", attempt);

    JobResult::Enum job_result = DownloaderRunJob(ctx->m_Downloader, heap, job_name, requests.m_Storage, int(requests.m_Size));

    if (JobResult::kInterrupted == job_result)
    {
      result = RecoveryResult::kInterrupted;
      break;
    }

    // A failed job leaves files missing; verification reports them.
    VerifyPassSummary summary;
    VerifyResult::Enum verify_result = VerifyManifest(ctx->m_Queue, ctx->m_State, ctx->m_Manifest, heap, &summary);

    if (VerifyResult::kAllValid == verify_result)
    {
      result = RecoveryResult::kRecovered;
      break;
    }

    if (VerifyResult::kInterrupted == verify_result)
    {
      result = RecoveryResult::kInterrupted;
      break;
    }

    if (VerifyResult::kStateError == verify_result || !FailureLedgerLoad(&current, ctx->m_State))
    {
      result = RecoveryResult::kStateError;
      break;
    }

    failing = &current;

    if (attempt == ctx->m_MaxAttempts)
    {
      result = RecoveryResult::kExhausted;
      break;
    }

    if (!WaitRetryDelay(ctx->m_RetryDelaySeconds))
    {
      result = RecoveryResult::kInterrupted;
      break;
    }
  }

  if (RecoveryResult::kExhausted == result)
  {
    Log(kError, "checksum validation failed after %d attempts", *attempts_out);

    // Nothing corrupt stays behind.
    for (const LedgerEntry& entry : failing->m_Entries)
    {
      Log(kError, "  %s (expected %s)", entry.m_Filename, entry.m_ExpectedChecksum);
      DeletePart(ctx, entry.m_Filename);
    }
  }

  FailureLedgerDestroy(&current);
  BufferDestroy(&requests, heap);

  return result;
}

}
