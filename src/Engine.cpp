#include "Engine.hpp"
#include "Downloader.hpp"
#include "FileInfo.hpp"
#include "ManifestSource.hpp"
#include "Recovery.hpp"
#include "SignalHandler.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>

namespace sf
{

static const char s_DefaultConfigFile[] = "snapfetch.lua";

namespace EngineState
{
  const char* Names[kCount] =
  {
    "unverified",
    "verifying",
    "all valid",
    "some failed",
    "recovering",
    "exhausted"
  };
}

namespace EngineResult
{
  const char* Names[kCount] =
  {
    "ok",
    "setup error",
    "checksum failures",
    "checksum validation exhausted",
    "interrupted"
  };
}

void EngineOptionsInit(EngineOptions* self)
{
  self->m_ShowHelp      = false;
  self->m_Verbose       = false;
  self->m_DebugMessages = false;
  self->m_Quiet         = false;
  self->m_DisplayStats  = false;
  self->m_ThreadCount   = -1;
  self->m_MaxAttempts   = -1;
  self->m_WorkingDir    = nullptr;
  self->m_ConfigFile    = nullptr;
}

void EngineSetState(Engine* self, EngineState::Enum state)
{
  if (state == self->m_CurrentState)
    return;

  Log(kInfo, "State: %s -> %s", EngineState::Names[self->m_CurrentState], EngineState::Names[state]);
  self->m_CurrentState = state;
}

static bool EngineLoadConfig(Engine* self)
{
  const char* config_file = self->m_Options.m_ConfigFile;

  if (!config_file)
  {
    if (!GetFileInfo(s_DefaultConfigFile).IsFile())
    {
      Log(kDebug, "no %s, using default configuration", s_DefaultConfigFile);
      return true;
    }
    config_file = s_DefaultConfigFile;
  }

  char error[1024];
  if (!LuaConfigLoad(&self->m_Config, config_file, &self->m_Heap, &self->m_Allocator, error))
  {
    Log(kError, "configuration error: %s", error);
    return false;
  }

  return true;
}

bool EngineInit(Engine* self, const EngineOptions* options)
{
  HeapInit(&self->m_Heap);
  LinearAllocInit(&self->m_Allocator, &self->m_Heap, MB(1), "engine alloc");

  self->m_Options      = *options;
  self->m_CurrentState = EngineState::kUnverified;

  SnapshotConfigInit(&self->m_Config);
  ManifestInit(&self->m_Manifest, &self->m_Heap);

  if (options->m_WorkingDir && !SetCwd(options->m_WorkingDir))
  {
    Log(kError, "couldn't change directory to %s: %s", options->m_WorkingDir, strerror(errno));
    ManifestDestroy(&self->m_Manifest);
    LinearAllocDestroy(&self->m_Allocator);
    HeapDestroy(&self->m_Heap);
    return false;
  }

  GetCwd(self->m_WorkingDir, sizeof self->m_WorkingDir);

  if (!EngineLoadConfig(self))
  {
    ManifestDestroy(&self->m_Manifest);
    LinearAllocDestroy(&self->m_Allocator);
    HeapDestroy(&self->m_Heap);
    return false;
  }

  // Command line beats configuration.
  if (options->m_ThreadCount >= 0)
    self->m_Config.m_Threads = options->m_ThreadCount;
  if (options->m_MaxAttempts >= 1)
    self->m_Config.m_MaxAttempts = options->m_MaxAttempts;

  int thread_count = self->m_Config.m_Threads > 0 ? self->m_Config.m_Threads : GetCpuCount();

  ValidationStateInit(&self->m_State, ".");
  ChecksumCacheInit(&self->m_Cache, self->m_State.m_CachePath);

  VerifyQueueConfig queue_config;
  queue_config.m_Heap        = &self->m_Heap;
  queue_config.m_ThreadCount = thread_count;
  queue_config.m_Cache       = &self->m_Cache;
  VerifyQueueInit(&self->m_Queue, &queue_config);

  Log(kDebug, "working directory %s", self->m_WorkingDir);
  return true;
}

void EngineDestroy(Engine* self)
{
  VerifyQueueDestroy(&self->m_Queue);
  ChecksumCacheDestroy(&self->m_Cache);
  ManifestDestroy(&self->m_Manifest);
  LinearAllocDestroy(&self->m_Allocator);
  HeapDestroy(&self->m_Heap);
}

static void EngineDownloaderConfig(const Engine* self, DownloaderConfig* config)
{
  config->m_Command      = self->m_Config.m_DownloadCommand;
  config->m_WorkingDir   = self->m_WorkingDir;
  config->m_StartTimeout = self->m_Config.m_StartTimeout;
  config->m_JobTimeout   = self->m_Config.m_JobTimeout;
}

static bool EngineParseManifest(Engine* self, const Buffer<char>& text)
{
  char part_base_url[kMaxUrlLength];
  ManifestSourcePartBaseUrl(&self->m_Config.m_Source, part_base_url);

  char error[1024];
  if (!ManifestParse(&self->m_Manifest, text.m_Storage, text.m_Size, part_base_url, error))
  {
    Log(kError, "manifest: %s", error);
    return false;
  }

  if (0 == ManifestEntryCount(&self->m_Manifest))
  {
    Log(kError, "manifest lists no files");
    return false;
  }

  Log(kInfo, "Manifest lists %d files", ManifestEntryCount(&self->m_Manifest));
  return true;
}

// A new manifest invalidates whatever was validated against the old one.
static bool EngineSyncStoredManifest(Engine* self, const Buffer<char>& text)
{
  if (StoredManifestMatches(&self->m_State, text.m_Storage, text.m_Size, &self->m_Heap))
    return true;

  Log(kInfo, "Manifest changed since the last run, validation state reset");

  if (!ValidationMarkerRemove(&self->m_State) || !FailureLedgerRemove(&self->m_State))
    return false;

  return StoredManifestStore(&self->m_State, text.m_Storage, text.m_Size);
}

static EngineResult::Enum EngineDownloadMissing(Engine* self)
{
  Buffer<DownloadRequest> requests;
  BufferInit(&requests);

  for (const ManifestEntry& entry : self->m_Manifest.m_Entries)
  {
    if (DownloaderPartNeedsFetch(entry.m_Filename))
    {
      DownloadRequest request;
      request.m_Url      = entry.m_Url;
      request.m_Filename = entry.m_Filename;
      BufferAppendOne(&requests, &self->m_Heap, request);
    }
  }

  EngineResult::Enum result = EngineResult::kOk;

  if (0 == requests.m_Size)
  {
    Log(kInfo, "All %d parts present, skipping download", ManifestEntryCount(&self->m_Manifest));
  }
  else
  {
    DownloaderConfig config;
    EngineDownloaderConfig(self, &config);

    JobResult::Enum job_result = DownloaderRunJob(&config, &self->m_Heap, "full", requests.m_Storage, int(requests.m_Size));

    if (JobResult::kInterrupted == job_result)
      result = EngineResult::kInterrupted;
    else if (JobResult::kOk != job_result)
      Log(kWarning, "full download incomplete (%s), continuing with verification", JobResult::Names[job_result]);
  }

  BufferDestroy(&requests, &self->m_Heap);
  return result;
}

static EngineResult::Enum EngineRunRecovery(Engine* self, const FailureLedger* ledger)
{
  EngineSetState(self, EngineState::kRecovering);

  DownloaderConfig downloader;
  EngineDownloaderConfig(self, &downloader);

  RecoveryContext ctx;
  ctx.m_Heap              = &self->m_Heap;
  ctx.m_Manifest          = &self->m_Manifest;
  ctx.m_State             = &self->m_State;
  ctx.m_Queue             = &self->m_Queue;
  ctx.m_Downloader        = &downloader;
  ctx.m_MaxAttempts       = self->m_Config.m_MaxAttempts;
  ctx.m_RetryDelaySeconds = self->m_Config.m_RetryDelay;

  int attempts = 0;
  RecoveryResult::Enum result = RecoverFailures(&ctx, ledger, &attempts);

  switch (result)
  {
    case RecoveryResult::kRecovered:
      EngineSetState(self, EngineState::kAllValid);
      Log(kInfo, "All files valid after %d recovery attempt%s", attempts, 1 == attempts ? "" : "s");
      return EngineResult::kOk;

    case RecoveryResult::kExhausted:
      EngineSetState(self, EngineState::kExhausted);
      return EngineResult::kExhausted;

    case RecoveryResult::kInterrupted:
      return EngineResult::kInterrupted;

    default:
      Log(kError, "recovery failed: %s", RecoveryResult::Names[result]);
      return EngineResult::kSetupError;
  }
}

EngineResult::Enum EngineSync(Engine* self)
{
  Buffer<char> text;
  BufferInit(&text);

  char error[1024];
  if (!ManifestSourceFetch(&self->m_Config.m_Source, &self->m_Heap, &text, error))
  {
    Log(kError, "couldn't fetch manifest: %s", error);
    BufferDestroy(&text, &self->m_Heap);
    return EngineResult::kSetupError;
  }

  bool ready = EngineParseManifest(self, text) && EngineSyncStoredManifest(self, text);
  BufferDestroy(&text, &self->m_Heap);

  if (!ready)
    return EngineResult::kSetupError;

  if (ValidationMarkerExists(&self->m_State))
  {
    Log(kInfo, "Checksums already validated");
    EngineSetState(self, EngineState::kAllValid);
    return EngineResult::kOk;
  }

  EngineResult::Enum download_result = EngineDownloadMissing(self);
  if (EngineResult::kOk != download_result)
    return download_result;

  EngineSetState(self, EngineState::kVerifying);

  VerifyPassSummary summary;
  VerifyResult::Enum verify_result = VerifyManifest(&self->m_Queue, &self->m_State, &self->m_Manifest, &self->m_Heap, &summary);

  switch (verify_result)
  {
    case VerifyResult::kAllValid:
      EngineSetState(self, EngineState::kAllValid);
      return EngineResult::kOk;
    case VerifyResult::kInterrupted:
      return EngineResult::kInterrupted;
    case VerifyResult::kStateError:
      return EngineResult::kSetupError;
    default:
      break;
  }

  EngineSetState(self, EngineState::kSomeFailed);

  FailureLedger ledger;
  FailureLedgerInit(&ledger, &self->m_Heap);

  EngineResult::Enum result = EngineResult::kSetupError;
  if (FailureLedgerLoad(&ledger, &self->m_State))
    result = EngineRunRecovery(self, &ledger);

  FailureLedgerDestroy(&ledger);
  return result;
}

EngineResult::Enum EngineRecover(Engine* self)
{
  Buffer<char> text;
  BufferInit(&text);

  if (!StoredManifestLoad(&self->m_State, &self->m_Heap, &text))
  {
    Log(kError, "no stored manifest in %s (%s), run sync first", self->m_WorkingDir, strerror(errno));
    BufferDestroy(&text, &self->m_Heap);
    return EngineResult::kSetupError;
  }

  bool parsed = EngineParseManifest(self, text);
  BufferDestroy(&text, &self->m_Heap);

  if (!parsed)
    return EngineResult::kSetupError;

  FailureLedger ledger;
  FailureLedgerInit(&ledger, &self->m_Heap);

  EngineResult::Enum result = EngineResult::kSetupError;

  if (FailureLedgerLoad(&ledger, &self->m_State))
  {
    if (0 == ledger.m_Entries.m_Size)
    {
      if (ValidationMarkerExists(&self->m_State))
        Log(kInfo, "Checksums already validated");
      else
        Log(kWarning, "no failures recorded, nothing to recover");

      result = EngineResult::kOk;
    }
    else
    {
      Log(kInfo, "Recovering %d failed file%s", int(ledger.m_Entries.m_Size), 1 == ledger.m_Entries.m_Size ? "" : "s");
      EngineSetState(self, EngineState::kSomeFailed);
      result = EngineRunRecovery(self, &ledger);
    }
  }

  FailureLedgerDestroy(&ledger);
  return result;
}

EngineResult::Enum EngineVerifyFiles(Engine* self, const VerifyRequest* requests, int count)
{
  if (ValidationMarkerExists(&self->m_State))
  {
    Log(kInfo, "Checksums already validated");
    EngineSetState(self, EngineState::kAllValid);
    return EngineResult::kOk;
  }

  EngineSetState(self, EngineState::kVerifying);

  VerifyOutcome* outcomes = HeapAllocateArrayZeroed<VerifyOutcome>(&self->m_Heap, count);

  VerifyPassSummary summary;
  VerifyResult::Enum verify_result = VerifyAll(&self->m_Queue, &self->m_State, requests, count, outcomes, &summary);

  HeapFree(&self->m_Heap, outcomes);

  switch (verify_result)
  {
    case VerifyResult::kAllValid:
      EngineSetState(self, EngineState::kAllValid);
      Log(kInfo, "All checksums validated successfully");
      return EngineResult::kOk;
    case VerifyResult::kSomeFailed:
      EngineSetState(self, EngineState::kSomeFailed);
      Log(kError, "Checksum validation failed for %d file%s, see %s",
          count - summary.m_PassedCount, 1 == count - summary.m_PassedCount ? "" : "s", self->m_State.m_LedgerPath);
      return EngineResult::kChecksumFailures;
    case VerifyResult::kInterrupted:
      return EngineResult::kInterrupted;
    default:
      return EngineResult::kSetupError;
  }
}

}
