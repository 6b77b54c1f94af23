#include "Downloader.hpp"
#include "Buffer.hpp"
#include "Exec.hpp"
#include "FileInfo.hpp"
#include "MemAllocHeap.hpp"
#include "Stats.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>

namespace sf
{

namespace JobResult
{
  const char* Names[kCount] =
  {
    "ok",
    "download job timed out",
    "download job vanished",
    "download job failed",
    "download job interrupted",
    "download job setup failed"
  };
}

static void ControlFileName(char (&out)[kMaxPathLength], const char* filename)
{
  snprintf(out, sizeof out, "%s.aria2", filename);
}

bool DownloaderPartNeedsFetch(const char* filename)
{
  char control[kMaxPathLength];
  ControlFileName(control, filename);

  FileInfo info = GetFileInfo(filename);
  if (!info.IsFile())
    return true;

  return GetFileInfo(control).Exists();
}

static bool WriteJobList(const char* list_path, MemAllocHeap* heap, const DownloadRequest* requests, int count)
{
  Buffer<char> text;
  BufferInit(&text);

  // aria2 input file format: URL line, then indented per-download options.
  for (int i = 0; i < count; ++i)
    BufferAppendFormat(&text, heap, "%s\n  out=%s\n", requests[i].m_Url, requests[i].m_Filename);

  bool success = WriteFileAtomic(list_path, text.m_Storage, text.m_Size);
  BufferDestroy(&text, heap);
  return success;
}

// Every requested file must be present and complete once the process is gone.
static int CountIncompleteParts(const DownloadRequest* requests, int count)
{
  int incomplete = 0;

  for (int i = 0; i < count; ++i)
  {
    const char* filename = requests[i].m_Filename;

    if (!GetFileInfo(filename).IsFile())
    {
      Log(kWarning, "download job finished without %s", filename);
      ++incomplete;
    }
    else if (DownloaderPartNeedsFetch(filename))
    {
      Log(kWarning, "download job left %s incomplete", filename);
      ++incomplete;
    }
  }

  return incomplete;
}

static void TearDownJob(const DownloadRequest* requests, int count)
{
  for (int i = 0; i < count; ++i)
  {
    const char* filename = requests[i].m_Filename;

    char control[kMaxPathLength];
    ControlFileName(control, filename);

    if (!GetFileInfo(control).Exists())
      continue;

    Log(kDebug, "removing partial download %s", filename);

    if (!RemoveFile(filename))
      Log(kWarning, "couldn't remove %s: %s", filename, strerror(errno));
    if (!RemoveFile(control))
      Log(kWarning, "couldn't remove %s: %s", control, strerror(errno));
  }
}

static JobResult::Enum JobResultFromExec(const ExecResult& result)
{
  switch (result.m_Status)
  {
    case ExecStatus::kExited:
      return 0 == result.m_ReturnCode ? JobResult::kOk : JobResult::kFailed;
    case ExecStatus::kStartTimeout:
    case ExecStatus::kTimeout:
      return JobResult::kTimeout;
    case ExecStatus::kInterrupted:
      return JobResult::kInterrupted;
    default:
      return JobResult::kFailed;
  }
}

JobResult::Enum DownloaderRunJob(
    const DownloaderConfig* config,
    MemAllocHeap*           heap,
    const char*             job_name,
    const DownloadRequest*  requests,
    int                     count)
{
  if (0 == count)
  {
    Log(kDebug, "download job %s: nothing to fetch", job_name);
    return JobResult::kOk;
  }

  TimingScope timing_scope(&g_Stats.m_DownloadJobCount, &g_Stats.m_DownloadJobTimeCycles);

  char list_path[kMaxPathLength];
  snprintf(list_path, sizeof list_path, "%s/.snapfetch-job-%s.txt", config->m_WorkingDir, job_name);

  if (!WriteJobList(list_path, heap, requests, count))
  {
    Log(kError, "download job %s: couldn't write URL list %s", job_name, list_path);
    return JobResult::kSetupError;
  }

  TemplateVariable vars[] =
  {
    { "input", list_path },
    { "dir",   config->m_WorkingDir },
  };

  char error[1024];
  Buffer<char> cmdline;
  BufferInit(&cmdline);

  if (!ExpandCommandTemplate(&cmdline, heap, config->m_Command, vars, int(ARRAY_SIZE(vars)), error))
  {
    Log(kError, "download job %s: %s", job_name, error);
    BufferDestroy(&cmdline, heap);
    RemoveFile(list_path);
    return JobResult::kSetupError;
  }

  Log(kInfo, "Starting download job %s for %d file%s", job_name, count, 1 == count ? "" : "s");

  char log_prefix[64];
  snprintf(log_prefix, sizeof log_prefix, "download %s", job_name);

  ExecOptions options;
  options.m_CommandLine         = cmdline.m_Storage;
  options.m_LogPrefix           = log_prefix;
  options.m_StartTimeoutSeconds = config->m_StartTimeout;
  options.m_TimeoutSeconds      = config->m_JobTimeout;
  options.m_Heap                = heap;
  options.m_CaptureStdout       = nullptr;

  ExecResult exec_result = ExecuteProcess(&options);

  BufferDestroy(&cmdline, heap);

  JobResult::Enum result = JobResultFromExec(exec_result);

  if (JobResult::kOk == result)
  {
    if (int incomplete = CountIncompleteParts(requests, count))
    {
      Log(kError, "download job %s exited with %d of %d files missing or incomplete", job_name, incomplete, count);
      result = JobResult::kVanished;
    }
  }

  if (!RemoveFile(list_path))
    Log(kWarning, "couldn't remove %s: %s", list_path, strerror(errno));

  if (JobResult::kOk != result)
  {
    Log(kError, "download job %s: %s", job_name, JobResult::Names[result]);
    TearDownJob(requests, count);
  }
  else
  {
    Log(kInfo, "Download job %s completed", job_name);
  }

  return result;
}

}
