#ifndef SNAPFETCH_LUACONFIG_HPP
#define SNAPFETCH_LUACONFIG_HPP

#include "Common.hpp"
#include "ManifestSource.hpp"

namespace sf
{
  struct MemAllocHeap;
  struct MemAllocLinear;

  // Settings read from the Snapshot table of the configuration file.
  struct SnapshotConfig
  {
    ManifestSourceConfig m_Source;
    const char          *m_DownloadCommand;
    int                  m_MaxAttempts;
    int                  m_RetryDelay;
    int                  m_StartTimeout;
    int                  m_JobTimeout;
    int                  m_Threads;       // 0 = CPU count
  };

  void SnapshotConfigInit(SnapshotConfig* config);

  // Run a Lua configuration file and pick up the keys of the table it returns,
  // or of its global Snapshot table. Keys it doesn't set keep their current
  // values. Strings are copied into `alloc`.
  bool LuaConfigLoad(
      SnapshotConfig* config,
      const char*     filename,
      MemAllocHeap*   heap,
      MemAllocLinear* alloc,
      char            (&error)[1024]);
}

#endif
