#ifndef SNAPFETCH_DOWNLOADER_HPP
#define SNAPFETCH_DOWNLOADER_HPP

#include "Common.hpp"

namespace sf
{
  struct MemAllocHeap;

  namespace JobResult
  {
    enum Enum
    {
      kOk          = 0,
      kTimeout     = 1, // Didn't start in time, or ran past the job timeout
      kVanished    = 2, // Process went away with requested files missing or incomplete
      kFailed      = 3, // Non-zero exit status, or killed by a signal
      kInterrupted = 4, // We were signalled to quit
      kSetupError  = 5, // Couldn't write the job's URL list or expand the command
      kCount
    };

    extern const char* Names[kCount];
  }

  struct DownloaderConfig
  {
    const char *m_Command;        // Template with {input} and {dir} placeholders
    const char *m_WorkingDir;     // Absolute download directory
    int         m_StartTimeout;   // Seconds
    int         m_JobTimeout;     // Seconds, 0 = no limit
  };

  struct DownloadRequest
  {
    const char *m_Url;
    const char *m_Filename;
  };

  // Run one isolated download job for `requests`, with its own URL list
  // file. Files are downloaded into the current directory, which must be the
  // configured working directory. A job that doesn't end in kOk is torn
  // down: the control files and partial downloads of its parts are removed.
  JobResult::Enum DownloaderRunJob(
      const DownloaderConfig* config,
      MemAllocHeap*           heap,
      const char*             job_name,
      const DownloadRequest*  requests,
      int                     count);

  // True if the part is missing or an earlier download of it never finished.
  bool DownloaderPartNeedsFetch(const char* filename);
}

#endif
