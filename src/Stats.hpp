#ifndef SNAPFETCH_STATS_HPP
#define SNAPFETCH_STATS_HPP

#include "Common.hpp"
#include "Atomic.hpp"

namespace sf
{

// Process-wide counters. Times are in microseconds.
struct SnapfetchStats
{
  uint32_t m_StatCount;
  uint64_t m_StatTimeCycles;

  uint32_t m_ExecCount;
  uint64_t m_ExecTimeCycles;

  uint64_t m_JsonParseTimeCycles;

  uint64_t m_DigestCacheSaveTimeCycles;
  uint32_t m_DigestCacheHits;
  uint32_t m_DigestCacheMisses;
  uint32_t m_FileDigestCount;
  uint64_t m_FileDigestTimeCycles;
  uint64_t m_FileDigestBytes;

  uint32_t m_DownloadJobCount;
  uint64_t m_DownloadJobTimeCycles;
};

struct TimingScope
{
  uint32_t* m_CountPtr;
  uint64_t* m_TimePtr;
  uint64_t  m_StartTime;

  TimingScope(uint32_t* count_ptr, uint64_t* time_ptr)
  {
    m_CountPtr  = count_ptr;
    m_TimePtr   = time_ptr;
    m_StartTime = TimerGet();
  }

  ~TimingScope()
  {
    uint64_t micros = TimerGet() - m_StartTime;
    if (uint32_t *ptr = m_CountPtr)
      AtomicIncrement(ptr);
    AtomicAdd(m_TimePtr, micros);
  }
};

extern SnapfetchStats g_Stats;

void StatsReset();

void StatsPrint();

}

#endif
