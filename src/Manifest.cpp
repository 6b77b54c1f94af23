#include "Manifest.hpp"
#include "Hash.hpp"
#include "MemAllocHeap.hpp"

#include <stdio.h>
#include <string.h>

namespace sf
{

void ManifestInit(Manifest* self, MemAllocHeap* heap)
{
  self->m_Heap = heap;
  self->m_Allocator.m_BasePointer = nullptr;
  self->m_Allocator.m_BackingHeap = heap;
  BufferInit(&self->m_Entries);
  HashTableInit(&self->m_EntryIndex, heap);
}

static void ManifestClear(Manifest* self)
{
  HashTableDestroy(&self->m_EntryIndex);
  BufferDestroy(&self->m_Entries, self->m_Heap);

  if (self->m_Allocator.m_BasePointer)
    LinearAllocDestroy(&self->m_Allocator);
}

void ManifestDestroy(Manifest* self)
{
  ManifestClear(self);
}

static bool IsBlank(const char* line, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    if (' ' != line[i] && '\t' != line[i])
      return false;
  }
  return true;
}

static char* BuildUrl(MemAllocLinear* alloc, const char* base_url, const char* path, size_t path_len)
{
  if (strstr(path, "://") || !base_url || !base_url[0])
    return StrDupN(alloc, path, path_len);

  while (path_len > 2 && '.' == path[0] && '/' == path[1])
  {
    path     += 2;
    path_len -= 2;
  }

  size_t base_len = strlen(base_url);
  while (base_len > 0 && '/' == base_url[base_len - 1])
    --base_len;

  char* url = static_cast<char*>(LinearAllocate(alloc, base_len + path_len + 2, 1));
  memcpy(url, base_url, base_len);
  url[base_len] = '/';
  memcpy(url + base_len + 1, path, path_len);
  url[base_len + 1 + path_len] = '\0';
  return url;
}

static bool ParseLine(
    Manifest*   self,
    const char* line,
    size_t      len,
    int         line_number,
    const char* part_base_url,
    char        (&error)[1024])
{
  HashDigest digest;

  if (len < 67 || !DigestFromStringN(&digest, line, 64) || ' ' != line[64])
  {
    snprintf(error, sizeof error, "line %d: expected \"<sha256>  <path>\"", line_number);
    return false;
  }

  // "  path" for text mode, " *path" for binary mode checksums.
  if (' ' != line[65] && '*' != line[65])
  {
    snprintf(error, sizeof error, "line %d: expected two spaces after checksum", line_number);
    return false;
  }

  const char* path     = line + 66;
  size_t      path_len = len - 66;

  // The rest of the line is the path, spaces included.
  char* path_copy = StrDupN(&self->m_Allocator, path, path_len);

  const char* slash    = strrchr(path_copy, '/');
  const char* basename = slash ? slash + 1 : path_copy;

  if ('\0' == basename[0] || 0 == strcmp(basename, ".") || 0 == strcmp(basename, ".."))
  {
    snprintf(error, sizeof error, "line %d: no filename in path \"%s\"", line_number, path_copy);
    return false;
  }

  uint32_t hash = Djb2HashPath(basename);

  if (HashTableLookup(&self->m_EntryIndex, hash, basename))
  {
    snprintf(error, sizeof error, "line %d: duplicate filename \"%s\"", line_number, basename);
    return false;
  }

  ManifestEntry entry;
  entry.m_Checksum     = StrDupN(&self->m_Allocator, line, 64);
  entry.m_Url          = BuildUrl(&self->m_Allocator, part_base_url, path_copy, path_len);
  entry.m_Filename     = basename;
  entry.m_FilenameHash = hash;

  int32_t index = int32_t(self->m_Entries.m_Size);
  BufferAppendOne(&self->m_Entries, self->m_Heap, entry);
  HashTableInsert(&self->m_EntryIndex, hash, basename, index);
  return true;
}

bool ManifestParse(Manifest* self, const char* text, size_t len, const char* part_base_url, char (&error)[1024])
{
  ManifestClear(self);
  ManifestInit(self, self->m_Heap);

  size_t line_count = 1;
  for (size_t i = 0; i < len; ++i)
  {
    if ('\n' == text[i])
      ++line_count;
  }

  // Every line copies its checksum and path, plus the URL built from them.
  size_t base_len = part_base_url ? strlen(part_base_url) : 0;
  LinearAllocInit(&self->m_Allocator, self->m_Heap, 3 * len + line_count * (base_len + 8) + 4096, "manifest");

  const char* cursor = text;
  const char* end    = text + len;
  int line_number = 0;

  while (cursor < end)
  {
    const char* eol = static_cast<const char*>(memchr(cursor, '\n', size_t(end - cursor)));
    if (!eol)
      eol = end;

    const char* line     = cursor;
    size_t      line_len = size_t(eol - cursor);
    cursor = eol + 1;
    ++line_number;

    if (line_len > 0 && '\r' == line[line_len - 1])
      --line_len;

    if (IsBlank(line, line_len))
      continue;

    if (!ParseLine(self, line, line_len, line_number, part_base_url, error))
    {
      ManifestClear(self);
      ManifestInit(self, self->m_Heap);
      return false;
    }
  }

  Log(kDebug, "parsed manifest: %d entries", ManifestEntryCount(self));
  return true;
}

const ManifestEntry* ManifestFind(const Manifest* self, const char* filename)
{
  int index = HashTableLookupIndex(&self->m_EntryIndex, Djb2HashPath(filename), filename);
  if (-1 == index)
    return nullptr;

  return &self->m_Entries[self->m_EntryIndex.m_Payloads[index]];
}

}
