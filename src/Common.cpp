#include "Common.hpp"

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <sys/time.h>
#include <unistd.h>
#include <errno.h>

namespace sf
{

void InitCommon(void)
{
  tzset();
}

void NORETURN Croak(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vfprintf(stderr, fmt, args);
  va_end(args);
  fprintf(stderr, "\n");
  exit(1);
}

void NORETURN CroakErrno(const char* fmt, ...)
{
  int err = errno;
  va_list args;
  va_start(args, fmt);
  vfprintf(stderr, fmt, args);
  va_end(args);
  fprintf(stderr, "\n");
  fprintf(stderr, "errno: %d (%s)\n", err, strerror(err));
  exit(1);
}

void NORETURN CroakAbort(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  vfprintf(stderr, fmt, args);
  va_end(args);
  fprintf(stderr, "\n");
  abort();
}

uint32_t Djb2Hash(const char *str_)
{
  const uint8_t *str = (const uint8_t *) str_;
  uint32_t hash      = 5381;
  int c;

  while (0 != (c = *str++))
  {
    hash = (hash * 33) + c;
  }

  return hash ? hash : 1;
}

uint32_t Djb2HashNoCase(const char *str_)
{
  const uint8_t *str = (const uint8_t *) str_;
  uint32_t hash = 5381;
  int c;

  while (0 != (c = *str++))
  {
    hash = (hash * 33) + FoldCase(c);
  }

  return hash ? hash : 1;
}

static int s_LogFlags = kError | kWarning | kInfo;

int GetLogFlags()
{
  return s_LogFlags;
}

void SetLogFlags(int log_flags)
{
  s_LogFlags = log_flags;
}

void Log(LogLevel level, const char* fmt, ...)
{
  if (0 == (s_LogFlags & level))
    return;

  const char* prefix = "?";

  switch (level)
  {
    case kError   : prefix = "E"; break;
    case kWarning : prefix = "W"; break;
    case kInfo    : prefix = "I"; break;
    case kDebug   : prefix = "D"; break;
    case kSpam    : prefix = "S"; break;
    default       : break;
  }

  char stamp[32];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  // Format the whole line up front so concurrent callers can't interleave.
  char line[4096];
  int len = snprintf(line, sizeof line, "[%s] [%s] ", stamp, prefix);

  va_list args;
  va_start(args, fmt);
  int msg_len = vsnprintf(line + len, sizeof(line) - len - 1, fmt, args);
  va_end(args);

  if (msg_len < 0)
    msg_len = 0;

  len += msg_len;
  if (len > int(sizeof(line)) - 2)
    len = int(sizeof(line)) - 2;

  line[len++] = '\n';
  line[len] = '\0';

  fputs(line, stderr);
}

void GetCwd(char* buffer, size_t buffer_size)
{
  if (NULL == getcwd(buffer, buffer_size))
    Croak("couldn't get working directory");
}

bool SetCwd(const char* dir)
{
  return 0 == chdir(dir);
}

bool RemoveFile(const char* path)
{
  if (0 == unlink(path))
    return true;
  return ENOENT == errno;
}

bool RenameFile(const char* oldf, const char* newf)
{
  return 0 == rename(oldf, newf);
}

bool WriteFileAtomic(const char* path, const void* data, size_t size)
{
  char tmp_path[kMaxPathLength];
  snprintf(tmp_path, sizeof tmp_path, "%s.tmp", path);

  FILE* f = fopen(tmp_path, "wb");
  if (!f)
  {
    Log(kWarning, "couldn't open %s for writing: %s", tmp_path, strerror(errno));
    return false;
  }

  bool success = size == fwrite(data, 1, size, f);

  if (0 != fclose(f))
    success = false;

  if (!success)
  {
    Log(kWarning, "couldn't write %s: %s", tmp_path, strerror(errno));
    remove(tmp_path);
    return false;
  }

  if (!RenameFile(tmp_path, path))
  {
    Log(kWarning, "couldn't rename %s to %s: %s", tmp_path, path, strerror(errno));
    remove(tmp_path);
    return false;
  }

  return true;
}

uint64_t TimerGet()
{
  struct timeval t;
  if (0 != gettimeofday(&t, NULL))
    CroakErrno("gettimeofday failed");
  return t.tv_usec + uint64_t(t.tv_sec) * 1000000;
}

double TimerToSeconds(uint64_t t)
{
  return t / 1000000.0;
}

double TimerDiffSeconds(uint64_t start, uint64_t end)
{
  return TimerToSeconds(end - start);
}

int GetCpuCount()
{
  long nprocs_max = sysconf(_SC_NPROCESSORS_CONF);
  if (nprocs_max < 0)
    CroakErrno("couldn't get CPU count");
  return (int) nprocs_max;
}

bool CopyString(char* dest, size_t dest_size, const char* src)
{
  size_t len = strlen(src);
  if (len >= dest_size)
  {
    memcpy(dest, src, dest_size - 1);
    dest[dest_size - 1] = '\0';
    return false;
  }
  memcpy(dest, src, len + 1);
  return true;
}

}
