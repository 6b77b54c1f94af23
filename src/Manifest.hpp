#ifndef SNAPFETCH_MANIFEST_HPP
#define SNAPFETCH_MANIFEST_HPP

#include "Common.hpp"
#include "Buffer.hpp"
#include "HashTable.hpp"
#include "MemAllocLinear.hpp"

namespace sf
{
  struct MemAllocHeap;

  struct ManifestEntry
  {
    const char *m_Checksum;
    const char *m_Url;
    const char *m_Filename;       // Basename of the manifest path
    uint32_t    m_FilenameHash;
  };

  // Parsed manifest. Entries keep manifest text order; filenames are unique.
  struct Manifest
  {
    MemAllocHeap                          *m_Heap;
    MemAllocLinear                         m_Allocator;
    Buffer<ManifestEntry>                  m_Entries;
    HashTable<int32_t, kFlagPathStrings>   m_EntryIndex;
  };

  void ManifestInit(Manifest* self, MemAllocHeap* heap);
  void ManifestDestroy(Manifest* self);

  // Parse manifest text made of "<sha256-hex>  <path>" lines. Relative paths
  // are appended to part_base_url to form the download URL.
  //
  // Any bad line fails the whole manifest, with the line number in `error`,
  // and leaves it empty.
  bool ManifestParse(Manifest* self, const char* text, size_t len, const char* part_base_url, char (&error)[1024]);

  const ManifestEntry* ManifestFind(const Manifest* self, const char* filename);

  inline int ManifestEntryCount(const Manifest* self)
  {
    return int(self->m_Entries.m_Size);
  }
}

#endif
