#include "ChecksumCache.hpp"
#include "Buffer.hpp"
#include "JsonParse.hpp"
#include "JsonWriter.hpp"
#include "Stats.hpp"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <inttypes.h>

namespace sf
{

// Size of an invalidated record. No file on disk has it.
static const uint64_t kInvalidSize = ~uint64_t(0);

// Fingerprints are stored as "<mtime>:<size>".
static bool ParseMetadata(const char* text, uint64_t* timestamp_out, uint64_t* size_out)
{
  char* end = nullptr;

  errno = 0;
  unsigned long long mtime = strtoull(text, &end, 10);
  if (end == text || ':' != *end || errno)
    return false;

  const char* size_text = end + 1;
  unsigned long long size = strtoull(size_text, &end, 10);
  if (end == size_text || '\0' != *end || errno)
    return false;

  *timestamp_out = mtime;
  *size_out      = size;
  return true;
}

static void LoadRecords(ChecksumCache* self, const JsonObjectValue* root)
{
  int skipped = 0;

  for (size_t i = 0; i < root->m_Count; ++i)
  {
    const char* filename = root->m_Names[i];
    const JsonValue* entry = root->m_Values[i];

    const char* checksum = entry->FindString("checksum");
    const char* metadata = entry->FindString("metadata");

    ChecksumCacheRecord record;

    if (!checksum || !metadata ||
        !DigestFromString(&record.m_Digest, checksum) ||
        !ParseMetadata(metadata, &record.m_Timestamp, &record.m_Size))
    {
      Log(kWarning, "checksum cache: ignoring malformed record for %s", filename);
      ++skipped;
      continue;
    }

    uint32_t hash = Djb2HashPath(filename);

    if (ChecksumCacheRecord* existing = HashTableLookup(&self->m_Table, hash, filename))
      *existing = record;
    else
      HashTableInsert(&self->m_Table, hash, StrDup(&self->m_Allocator, filename), record);
  }

  // Rewrite the document next time so the bad records go away.
  if (skipped)
    self->m_Dirty = true;
}

static void LoadDocument(ChecksumCache* self)
{
  MemAllocHeap* heap = &self->m_Heap;

  Buffer<char> text;
  BufferInit(&text);

  if (!BufferReadFile(&text, heap, self->m_Filename))
  {
    if (ENOENT != errno)
      Log(kWarning, "checksum cache %s unreadable (%s); starting with an empty cache", self->m_Filename, strerror(errno));
    BufferDestroy(&text, heap);
    return;
  }

  BufferCString(&text, heap);

  MemAllocLinear json_alloc, json_scratch;
  LinearAllocInit(&json_alloc, heap, text.m_Size * 4 + KB(64), "cache json");
  LinearAllocInit(&json_scratch, heap, text.m_Size * 2 + KB(64), "cache json scratch");

  char error_msg[1024];
  const JsonValue* root = JsonParse(text.m_Storage, &json_alloc, &json_scratch, error_msg);

  if (!root)
  {
    Log(kWarning, "checksum cache %s is corrupt (%s); starting with an empty cache", self->m_Filename, error_msg);
  }
  else if (const JsonObjectValue* obj = root->AsObject())
  {
    LoadRecords(self, obj);
    Log(kDebug, "checksum cache initialized -- %d entries", (int) self->m_Table.m_RecordCount);
  }
  else
  {
    Log(kWarning, "checksum cache %s is corrupt (top level is not an object); starting with an empty cache", self->m_Filename);
  }

  LinearAllocDestroy(&json_scratch);
  LinearAllocDestroy(&json_alloc);
  BufferDestroy(&text, heap);
}

void ChecksumCacheInit(ChecksumCache* self, const char* filename)
{
  ReadWriteLockInit(&self->m_Lock);

  CopyString(self->m_Filename, sizeof self->m_Filename, filename);
  self->m_Dirty = false;

  HeapInit(&self->m_Heap);

  // Filenames are interned here for the lifetime of the cache.
  FileInfo info = GetFileInfo(filename);
  size_t name_space = MB(8) + (info.Exists() ? size_t(info.m_Size) : 0);
  LinearAllocInit(&self->m_Allocator, &self->m_Heap, name_space, "checksum cache names");

  HashTableInit(&self->m_Table, &self->m_Heap);

  LoadDocument(self);
}

void ChecksumCacheDestroy(ChecksumCache* self)
{
  HashTableDestroy(&self->m_Table);
  LinearAllocDestroy(&self->m_Allocator);
  HeapDestroy(&self->m_Heap);
  ReadWriteLockDestroy(&self->m_Lock);
}

struct CacheSaveEntry
{
  const char*                m_Filename;
  const ChecksumCacheRecord* m_Record;
};

static int CompareSaveEntries(const void* l, const void* r)
{
  return strcmp(((const CacheSaveEntry*) l)->m_Filename, ((const CacheSaveEntry*) r)->m_Filename);
}

bool ChecksumCacheSave(ChecksumCache* self)
{
  TimingScope timing_scope(nullptr, &g_Stats.m_DigestCacheSaveTimeCycles);

  // Exclusive for the whole save so an update can't slip in between writing
  // the document and clearing the dirty flag.
  WriteLockScope lock(&self->m_Lock);

  if (!self->m_Dirty)
    return true;

  MemAllocHeap* heap = &self->m_Heap;

  // Sorted output keeps the document stable between runs.
  Buffer<CacheSaveEntry> entries;
  BufferInitWithCapacity(&entries, heap, self->m_Table.m_RecordCount);

  HashTableWalk(&self->m_Table, [&](uint32_t, uint32_t, const char* filename, const ChecksumCacheRecord& record)
  {
    if (kInvalidSize == record.m_Size)
      return;
    CacheSaveEntry entry = { filename, &record };
    BufferAppendOne(&entries, heap, entry);
  });

  qsort(entries.m_Storage, entries.m_Size, sizeof(CacheSaveEntry), CompareSaveEntries);

  JsonWriter writer;
  JsonWriteInit(&writer, heap);
  JsonWriteStartObject(&writer);

  for (const CacheSaveEntry& entry : entries)
  {
    char digest[kDigestStringSize];
    DigestToString(digest, entry.m_Record->m_Digest);

    char metadata[64];
    snprintf(metadata, sizeof metadata, "%" PRIu64 ":%" PRIu64, entry.m_Record->m_Timestamp, entry.m_Record->m_Size);

    JsonWriteKeyName(&writer, entry.m_Filename);
    JsonWriteStartObject(&writer);
    JsonWriteKeyName(&writer, "checksum");
    JsonWriteValueString(&writer, digest);
    JsonWriteKeyName(&writer, "metadata");
    JsonWriteValueString(&writer, metadata);
    JsonWriteEndObject(&writer);
  }

  JsonWriteEndObject(&writer);

  bool success = JsonWriteToFile(&writer, self->m_Filename);

  JsonWriteDestroy(&writer);
  BufferDestroy(&entries, heap);

  if (success)
  {
    self->m_Dirty = false;
    Log(kDebug, "checksum cache saved to %s", self->m_Filename);
  }
  else
  {
    Log(kWarning, "failed to save checksum cache %s", self->m_Filename);
  }

  return success;
}

bool ChecksumCacheGet(ChecksumCache* self, const char* filename, const FileInfo& fingerprint, HashDigest* digest_out)
{
  bool result = false;
  uint32_t hash = Djb2HashPath(filename);

  {
    ReadLockScope lock(&self->m_Lock);

    if (const ChecksumCacheRecord* r = HashTableLookup(&self->m_Table, hash, filename))
    {
      if (r->m_Timestamp == fingerprint.m_Timestamp && r->m_Size == fingerprint.m_Size)
      {
        *digest_out = r->m_Digest;
        result      = true;
      }
    }
  }

  AtomicIncrement(result ? &g_Stats.m_DigestCacheHits : &g_Stats.m_DigestCacheMisses);

  return result;
}

void ChecksumCacheSet(ChecksumCache* self, const char* filename, const FileInfo& fingerprint, const HashDigest& digest)
{
  uint32_t hash = Djb2HashPath(filename);

  ChecksumCacheRecord record;
  record.m_Digest    = digest;
  record.m_Timestamp = fingerprint.m_Timestamp;
  record.m_Size      = fingerprint.m_Size;

  WriteLockScope lock(&self->m_Lock);

  if (ChecksumCacheRecord* r = HashTableLookup(&self->m_Table, hash, filename))
    *r = record;
  else
    HashTableInsert(&self->m_Table, hash, StrDup(&self->m_Allocator, filename), record);

  self->m_Dirty = true;
}

void ChecksumCacheInvalidate(ChecksumCache* self, const char* filename)
{
  uint32_t hash = Djb2HashPath(filename);

  WriteLockScope lock(&self->m_Lock);

  if (ChecksumCacheRecord* r = HashTableLookup(&self->m_Table, hash, filename))
  {
    if (kInvalidSize != r->m_Size)
    {
      r->m_Timestamp = 0;
      r->m_Size      = kInvalidSize;
      self->m_Dirty  = true;
    }
  }
}

int ChecksumCacheCount(ChecksumCache* self)
{
  int count = 0;

  ReadLockScope lock(&self->m_Lock);
  HashTableWalk(&self->m_Table, [&](uint32_t, uint32_t, const char*, const ChecksumCacheRecord& record)
  {
    if (kInvalidSize != record.m_Size)
      ++count;
  });

  return count;
}

}
