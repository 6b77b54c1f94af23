#ifndef SNAPFETCH_FILEINFO_HPP
#define SNAPFETCH_FILEINFO_HPP

#include "Common.hpp"

namespace sf
{

// Result of a single stat() call. The (m_Timestamp, m_Size) pair is the file's
// fingerprint: a cheap stand-in for its contents. Two different contents with
// identical mtime and size are indistinguishable to it.
struct FileInfo
{
  enum
  {
    kFlagExists       = 1 << 0,
    kFlagError        = 1 << 1,
    kFlagFile         = 1 << 2,
    kFlagDirectory    = 1 << 3
  };

  uint32_t      m_Flags;
  int           m_Errno;
  uint64_t      m_Size;
  uint64_t      m_Timestamp;

  bool Exists()      const { return 0 != (kFlagExists & m_Flags); }
  bool IsError()     const { return 0 != (kFlagError & m_Flags); }
  bool IsFile()      const { return 0 != (kFlagFile & m_Flags); }
  bool IsDirectory() const { return 0 != (kFlagDirectory & m_Flags); }
};

// A path that doesn't exist yields a FileInfo with no flags set; any other
// stat() failure sets kFlagError and records errno.
FileInfo GetFileInfo(const char* path);

// Same as GetFileInfo() for a file that is already open.
FileInfo GetOpenFileInfo(int fd);

inline bool SameFingerprint(const FileInfo& a, const FileInfo& b)
{
  return a.m_Timestamp == b.m_Timestamp && a.m_Size == b.m_Size;
}

}

#endif
