#include "Verifier.hpp"
#include "ChecksumCache.hpp"
#include "FileInfo.hpp"
#include "Stats.hpp"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

namespace sf
{

namespace VerifyStatus
{
  const char* Names[kCount] =
  {
    "success",
    "checksum mismatch",
    "i/o error"
  };
}

bool ComputeFileDigest(const char* filename, HashDigest* digest_out, FileInfo* info_out, int* errno_out)
{
  TimingScope timing_scope(&g_Stats.m_FileDigestCount, &g_Stats.m_FileDigestTimeCycles);

  int fd = open(filename, O_RDONLY);
  if (-1 == fd)
  {
    *errno_out = errno;
    return false;
  }

  HashState h;
  HashInit(&h);

  uint64_t total = 0;
  char buffer[65536];

  for (;;)
  {
    ssize_t nbytes = read(fd, buffer, sizeof buffer);

    if (nbytes > 0)
    {
      HashUpdate(&h, buffer, size_t(nbytes));
      total += uint64_t(nbytes);
    }
    else if (0 == nbytes)
    {
      break;
    }
    else if (EINTR != errno)
    {
      *errno_out = errno;
      close(fd);
      HashDiscard(&h);
      return false;
    }
  }

  // Taken after the last read so it describes the bytes that were hashed.
  *info_out = GetOpenFileInfo(fd);
  close(fd);

  HashFinalize(&h, digest_out);
  AtomicAdd(&g_Stats.m_FileDigestBytes, total);
  return true;
}

static void SetIoError(VerifyOutcome* outcome, int err)
{
  outcome->m_Status            = VerifyStatus::kIoError;
  outcome->m_Errno             = err;
  outcome->m_ActualChecksum[0] = '\0';
}

void VerifyFile(ChecksumCache* cache, const VerifyRequest* request, VerifyOutcome* outcome)
{
  const char* filename = request->m_Filename;

  outcome->m_Filename          = filename;
  outcome->m_ExpectedChecksum  = request->m_ExpectedChecksum;
  outcome->m_ActualChecksum[0] = '\0';
  outcome->m_Errno             = 0;
  outcome->m_CacheHit          = false;

  HashDigest expected;
  if (!DigestFromString(&expected, request->m_ExpectedChecksum))
  {
    // Can't match anything; treat like content that doesn't verify.
    Log(kError, "%s: expected checksum '%s' is not a sha256 digest", filename, request->m_ExpectedChecksum);
    outcome->m_Status = VerifyStatus::kMismatch;
    return;
  }

  FileInfo info = GetFileInfo(filename);

  if (!info.Exists())
  {
    SetIoError(outcome, info.IsError() ? info.m_Errno : ENOENT);
    Log(kError, "%s: cannot verify: %s", filename, strerror(outcome->m_Errno));
    return;
  }

  if (!info.IsFile())
  {
    SetIoError(outcome, EISDIR);
    Log(kError, "%s: cannot verify: not a regular file", filename);
    return;
  }

  HashDigest actual;

  if (ChecksumCacheGet(cache, filename, info, &actual))
  {
    Log(kDebug, "Using cached checksum for %s", filename);
    outcome->m_CacheHit = true;
  }
  else
  {
    Log(kInfo, "Computing checksum for %s", filename);

    int err = 0;
    FileInfo hashed;
    if (!ComputeFileDigest(filename, &actual, &hashed, &err))
    {
      SetIoError(outcome, err);
      Log(kError, "%s: read failed: %s", filename, strerror(err));
      return;
    }

    // Only remember the digest if the file didn't change while we read it.
    if (!hashed.IsError() && SameFingerprint(info, hashed))
      ChecksumCacheSet(cache, filename, info, actual);
    else
      Log(kWarning, "%s changed while it was being hashed; not caching its checksum", filename);
  }

  DigestToString(outcome->m_ActualChecksum, actual);

  if (actual == expected)
  {
    outcome->m_Status = VerifyStatus::kSuccess;
    Log(kDebug, "%s: checksum ok", filename);
  }
  else
  {
    outcome->m_Status = VerifyStatus::kMismatch;
    Log(kError, "Checksum mismatch for %s: expected %s, got %s", filename, request->m_ExpectedChecksum, outcome->m_ActualChecksum);
  }
}

}
