#include "FileInfo.hpp"
#include "Stats.hpp"

#include <sys/stat.h>
#include <errno.h>

namespace sf
{

static FileInfo FileInfoFromStat(const struct stat& stbuf)
{
  uint32_t flags = FileInfo::kFlagExists;

  switch (stbuf.st_mode & S_IFMT)
  {
    case S_IFDIR: flags |= FileInfo::kFlagDirectory; break;
    case S_IFREG: flags |= FileInfo::kFlagFile; break;
    default: break;
  }

  FileInfo result;
  result.m_Flags     = flags;
  result.m_Errno     = 0;
  result.m_Timestamp = stbuf.st_mtime;
  result.m_Size      = stbuf.st_size;
  return result;
}

static FileInfo FileInfoFromErrno(int err)
{
  FileInfo result;
  result.m_Flags     = (err == ENOENT || err == ENOTDIR) ? 0 : FileInfo::kFlagError;
  result.m_Errno     = err;
  result.m_Timestamp = 0;
  result.m_Size      = 0;
  return result;
}

FileInfo GetFileInfo(const char* path)
{
  TimingScope timing_scope(&g_Stats.m_StatCount, &g_Stats.m_StatTimeCycles);

  struct stat stbuf;
  if (0 != stat(path, &stbuf))
    return FileInfoFromErrno(errno);

  return FileInfoFromStat(stbuf);
}

FileInfo GetOpenFileInfo(int fd)
{
  TimingScope timing_scope(&g_Stats.m_StatCount, &g_Stats.m_StatTimeCycles);

  struct stat stbuf;
  if (0 != fstat(fd, &stbuf))
  {
    // The descriptor is open, so the file exists whatever fstat says.
    FileInfo result = FileInfoFromErrno(errno);
    result.m_Flags |= FileInfo::kFlagError;
    return result;
  }

  return FileInfoFromStat(stbuf);
}

}
