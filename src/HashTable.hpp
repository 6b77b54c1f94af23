#ifndef SNAPFETCH_HASHTABLE_HPP
#define SNAPFETCH_HASHTABLE_HPP

#include "Common.hpp"
#include "MemAllocHeap.hpp"

#include <cstring>

namespace sf
{
  enum HashTableFlags
  {
    kFlagCaseSensitive   = 0,
    kFlagCaseInsensitive = 1 << 0,

#if ENABLED(SNAPFETCH_CASE_INSENSITIVE_FILESYSTEM)
    kFlagPathStrings = kFlagCaseInsensitive,
#else
    kFlagPathStrings = kFlagCaseSensitive,
#endif
  };

  // Open addressing string-keyed table. Hashes must be non-zero (Djb2Hash
  // guarantees it); zero marks an empty slot. Key strings are not copied and
  // must outlive the table.
  template <typename T, uint32_t kFlags>
  struct HashTable
  {
    uint32_t*      m_Hashes;
    const char**   m_Strings;
    T*             m_Payloads;
    uint32_t       m_TableSize;
    uint32_t       m_TableSizeShift;
    uint32_t       m_RecordCount;
    MemAllocHeap  *m_Heap;
  };

  template <typename T, uint32_t kFlags>
  void HashTableInit(HashTable<T, kFlags>* self, MemAllocHeap* heap)
  {
    self->m_Hashes         = nullptr;
    self->m_Strings        = nullptr;
    self->m_Payloads       = nullptr;
    self->m_TableSize      = 0;
    self->m_TableSizeShift = 0;
    self->m_RecordCount    = 0;
    self->m_Heap           = heap;
  }

  template <typename T, uint32_t kFlags>
  void HashTableDestroy(HashTable<T, kFlags>* self)
  {
    HeapFree(self->m_Heap, self->m_Hashes);
    HeapFree(self->m_Heap, self->m_Strings);
    HeapFree(self->m_Heap, self->m_Payloads);
    HashTableInit(self, self->m_Heap);
  }

  inline int FastCompareNoCase(const char* lhs, const char* rhs)
  {
    for (;;)
    {
      int lc = *lhs++;
      int rc = *rhs++;

      int diff = FoldCase(lc) - FoldCase(rc);
      if (diff != 0)
        return diff;

      if (lc == 0 || rc == 0)
        return 0;
    }
  }

  template <typename T, uint32_t kFlags>
  int HashTableLookupIndex(const HashTable<T, kFlags>* self, uint32_t hash, const char* string)
  {
    uint32_t size = self->m_TableSize;

    if (0 == size)
      return -1;

    int (*compare_fn)(const char* l, const char* r) = (kFlags & kFlagCaseInsensitive) ? FastCompareNoCase : strcmp;

    const uint32_t* hashes = self->m_Hashes;
    const char* const* strings = self->m_Strings;

    uint32_t index = hash & (size - 1);

    for (;;)
    {
      uint32_t candidate_hash = hashes[index];

      if (!candidate_hash)
        return -1;

      if (hash == candidate_hash)
      {
        const char* candidate_string = strings[index];
        if (candidate_string == string || compare_fn(candidate_string, string) == 0)
          return int(index);
      }

      index = (index + 1) & (size - 1);
    }
  }

  template <typename T, uint32_t kFlags>
  T* HashTableLookup(HashTable<T, kFlags>* self, uint32_t hash, const char* string)
  {
    int index = HashTableLookupIndex(self, hash, string);

    if (-1 == index)
      return nullptr;

    return self->m_Payloads + index;
  }

  template <typename T, uint32_t kFlags>
  void HashTableGrow(HashTable<T, kFlags>* self)
  {
    MemAllocHeap*  heap      = self->m_Heap;

    const uint32_t old_size  = self->m_TableSize;
    // start at 1<<7 (128), increase by 4x each time
    const uint32_t new_shift = self->m_TableSizeShift + 2 > 7u ? self->m_TableSizeShift + 2 : 7u;
    const uint32_t new_size  = 1u << new_shift;
    const uint32_t new_mask  = new_size - 1;

    uint32_t* new_hashes = HeapAllocateArrayZeroed<uint32_t>(heap, new_size);
    const char** new_strings = HeapAllocateArrayZeroed<const char*>(heap, new_size);
    T* new_payloads = HeapAllocateArrayZeroed<T>(heap, new_size);

    for (uint32_t i = 0; i < old_size; ++i)
    {
      if (uint32_t h = self->m_Hashes[i])
      {
        uint32_t index = h & new_mask;

        while (new_hashes[index] != 0)
          index = (index + 1) & new_mask;

        new_hashes[index]   = h;
        new_strings[index]  = self->m_Strings[i];
        new_payloads[index] = self->m_Payloads[i];
      }
    }

    HeapFree(heap, self->m_Payloads);
    HeapFree(heap, self->m_Strings);
    HeapFree(heap, self->m_Hashes);

    self->m_Hashes         = new_hashes;
    self->m_Strings        = new_strings;
    self->m_Payloads       = new_payloads;
    self->m_TableSize      = new_size;
    self->m_TableSizeShift = new_shift;
  }

  // Inserts a new record. The key must not already be present; use
  // HashTableLookup first to update in place.
  template <typename T, uint32_t kFlags>
  void HashTableInsert(HashTable<T, kFlags>* self, uint32_t hash, const char* string, const T& payload)
  {
    CHECK(hash != 0);

    uint64_t load = 0x100 * uint64_t(self->m_RecordCount + 1) >> uint64_t(self->m_TableSizeShift);

    // Keep the load factor under ~30%.
    if (load > 0x050)
      HashTableGrow(self);

    const uint32_t mask = self->m_TableSize - 1;
    uint32_t index = hash & mask;

    while (self->m_Hashes[index] != 0)
      index = (index + 1) & mask;

    self->m_Hashes[index]   = hash;
    self->m_Strings[index]  = string;
    self->m_Payloads[index] = payload;
    self->m_RecordCount    += 1;
  }

  template <typename T, uint32_t kFlags, typename Callback>
  void HashTableWalk(const HashTable<T, kFlags>* self, Callback callback)
  {
    uint32_t index = 0;
    for (uint32_t i = 0, count = self->m_TableSize; i < count; ++i)
    {
      if (uint32_t hash = self->m_Hashes[i])
      {
        callback(index, hash, self->m_Strings[i], self->m_Payloads[i]);
        ++index;
      }
    }

    CHECK(index == self->m_RecordCount);
  }
}

#endif
