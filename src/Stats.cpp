#include "Stats.hpp"

#include <cstdio>
#include <cstring>

namespace sf
{

SnapfetchStats g_Stats;

void StatsReset()
{
  memset(&g_Stats, 0, sizeof g_Stats);
}

static void PrintTimed(const char* label, uint32_t count, uint64_t micros)
{
  printf("  %-22s %6u calls %9.3f s\n", label, count, TimerToSeconds(micros));
}

void StatsPrint()
{
  printf("statistics:\n");
  PrintTimed("stat", g_Stats.m_StatCount, g_Stats.m_StatTimeCycles);
  PrintTimed("file digests", g_Stats.m_FileDigestCount, g_Stats.m_FileDigestTimeCycles);
  printf("  %-22s %6u hits %6u misses\n", "checksum cache", g_Stats.m_DigestCacheHits, g_Stats.m_DigestCacheMisses);
  printf("  %-22s %9.3f s\n", "checksum cache save", TimerToSeconds(g_Stats.m_DigestCacheSaveTimeCycles));
  printf("  %-22s %9.3f s\n", "json parsing", TimerToSeconds(g_Stats.m_JsonParseTimeCycles));
  printf("  %-22s %.1f MB\n", "bytes digested", double(g_Stats.m_FileDigestBytes) / (1024.0 * 1024.0));
  PrintTimed("exec", g_Stats.m_ExecCount, g_Stats.m_ExecTimeCycles);
  PrintTimed("download jobs", g_Stats.m_DownloadJobCount, g_Stats.m_DownloadJobTimeCycles);
}

}
