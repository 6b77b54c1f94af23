#ifndef SNAPFETCH_CHECKSUMCACHE_HPP
#define SNAPFETCH_CHECKSUMCACHE_HPP

#include "Common.hpp"
#include "FileInfo.hpp"
#include "Hash.hpp"
#include "HashTable.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"
#include "ReadWriteLock.hpp"

namespace sf
{
  struct ChecksumCacheRecord
  {
    HashDigest m_Digest;
    uint64_t   m_Timestamp;
    uint64_t   m_Size;
  };

  // Persistent map from filename to the digest computed for it, valid only
  // while the file still has the fingerprint it had when it was digested.
  //
  // Lookups and stores may come from any verification thread. Stores are
  // kept in memory and written out by ChecksumCacheSave().
  struct ChecksumCache
  {
    ReadWriteLock           m_Lock;
    char                    m_Filename[kMaxPathLength];
    MemAllocHeap            m_Heap;
    MemAllocLinear          m_Allocator;
    HashTable<ChecksumCacheRecord, kFlagPathStrings> m_Table;
    bool                    m_Dirty;
  };

  // Loads `filename` if it exists. A document that can't be read or parsed is
  // logged and ignored; the cache then starts out empty.
  void ChecksumCacheInit(ChecksumCache* self, const char* filename);

  void ChecksumCacheDestroy(ChecksumCache* self);

  // Writes the document if anything changed since it was loaded or last saved.
  bool ChecksumCacheSave(ChecksumCache* self);

  bool ChecksumCacheGet(ChecksumCache* self, const char* filename, const FileInfo& fingerprint, HashDigest* digest_out);

  void ChecksumCacheSet(ChecksumCache* self, const char* filename, const FileInfo& fingerprint, const HashDigest& digest);

  // Drop the record for a file that is about to be replaced. A replacement
  // written within the same second with the same size would otherwise match
  // the old fingerprint.
  void ChecksumCacheInvalidate(ChecksumCache* self, const char* filename);

  int ChecksumCacheCount(ChecksumCache* self);
}

#endif
