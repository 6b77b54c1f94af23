#include "ValidationState.hpp"
#include "FileInfo.hpp"
#include "MemAllocHeap.hpp"
#include "Verifier.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

namespace sf
{

static void JoinPath(char (&out)[kMaxPathLength], const char* dir, const char* name)
{
  if (!dir || !dir[0] || 0 == strcmp(dir, "."))
    snprintf(out, sizeof out, "%s", name);
  else
    snprintf(out, sizeof out, "%s/%s", dir, name);
}

void ValidationStateInit(ValidationState* self, const char* dir)
{
  JoinPath(self->m_CachePath, dir, ".checksum_cache.json");
  JoinPath(self->m_LedgerPath, dir, ".checksum_failures.txt");
  JoinPath(self->m_MarkerPath, dir, ".checksums_validated");
  JoinPath(self->m_ManifestCopyPath, dir, ".snapshot_manifest.txt");
}

bool ValidationMarkerExists(const ValidationState* self)
{
  return GetFileInfo(self->m_MarkerPath).Exists();
}

bool ValidationMarkerWrite(const ValidationState* self, const VerifyOutcome* outcomes, int count, MemAllocHeap* heap)
{
  char stamp[32];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  Buffer<char> text;
  BufferInit(&text);
  BufferAppendFormat(&text, heap, "# %d files validated at %s\n", count, stamp);

  for (int i = 0; i < count; ++i)
    BufferAppendFormat(&text, heap, "%s  %s\n", outcomes[i].m_ActualChecksum, outcomes[i].m_Filename);

  bool success = WriteFileAtomic(self->m_MarkerPath, text.m_Storage, text.m_Size);
  BufferDestroy(&text, heap);

  if (!success)
    Log(kError, "couldn't write validation marker %s", self->m_MarkerPath);

  return success;
}

bool ValidationMarkerRemove(const ValidationState* self)
{
  if (!RemoveFile(self->m_MarkerPath))
  {
    Log(kError, "couldn't remove validation marker %s: %s", self->m_MarkerPath, strerror(errno));
    return false;
  }
  return true;
}

void FailureLedgerInit(FailureLedger* self, MemAllocHeap* heap)
{
  self->m_Heap = heap;
  BufferInit(&self->m_Text);
  BufferInit(&self->m_Entries);
}

void FailureLedgerDestroy(FailureLedger* self)
{
  BufferDestroy(&self->m_Entries, self->m_Heap);
  BufferDestroy(&self->m_Text, self->m_Heap);
}

bool FailureLedgerWrite(const ValidationState* state, const VerifyOutcome* outcomes, int count, MemAllocHeap* heap)
{
  Buffer<char> text;
  BufferInit(&text);

  for (int i = 0; i < count; ++i)
  {
    const VerifyOutcome& outcome = outcomes[i];
    if (VerifyStatus::kSuccess != outcome.m_Status)
      BufferAppendFormat(&text, heap, "%s|%s\n", outcome.m_Filename, outcome.m_ExpectedChecksum);
  }

  bool success = WriteFileAtomic(state->m_LedgerPath, text.m_Storage, text.m_Size);
  BufferDestroy(&text, heap);

  if (!success)
    Log(kError, "couldn't write failure ledger %s", state->m_LedgerPath);

  return success;
}

bool FailureLedgerLoad(FailureLedger* self, const ValidationState* state)
{
  BufferClear(&self->m_Text);
  BufferClear(&self->m_Entries);

  if (!BufferReadFile(&self->m_Text, self->m_Heap, state->m_LedgerPath))
  {
    if (ENOENT == errno)
      return true;

    Log(kError, "couldn't read failure ledger %s: %s", state->m_LedgerPath, strerror(errno));
    return false;
  }

  BufferCString(&self->m_Text, self->m_Heap);
  char* cursor = self->m_Text.m_Storage;
  int line_number = 0;

  while (*cursor)
  {
    char* line = cursor;
    char* eol = strchr(line, '\n');
    if (eol)
    {
      *eol = '\0';
      cursor = eol + 1;
    }
    else
    {
      cursor = line + strlen(line);
    }

    ++line_number;

    size_t len = strlen(line);
    if (len > 0 && '\r' == line[len - 1])
      line[--len] = '\0';

    if (0 == len)
      continue;

    char* sep = strrchr(line, '|');
    if (!sep || sep == line || '\0' == sep[1])
    {
      Log(kWarning, "%s:%d: ignoring malformed ledger line", state->m_LedgerPath, line_number);
      continue;
    }

    *sep = '\0';

    LedgerEntry entry;
    entry.m_Filename         = line;
    entry.m_ExpectedChecksum = sep + 1;
    BufferAppendOne(&self->m_Entries, self->m_Heap, entry);
  }

  return true;
}

bool FailureLedgerRemove(const ValidationState* state)
{
  if (!RemoveFile(state->m_LedgerPath))
  {
    Log(kError, "couldn't remove failure ledger %s: %s", state->m_LedgerPath, strerror(errno));
    return false;
  }
  return true;
}

bool StoredManifestMatches(const ValidationState* self, const char* text, size_t len, MemAllocHeap* heap)
{
  Buffer<char> stored;
  BufferInit(&stored);

  bool matches = false;

  if (BufferReadFile(&stored, heap, self->m_ManifestCopyPath))
    matches = stored.m_Size == len && 0 == memcmp(stored.m_Storage, text, len);

  BufferDestroy(&stored, heap);
  return matches;
}

bool StoredManifestStore(const ValidationState* self, const char* text, size_t len)
{
  if (!WriteFileAtomic(self->m_ManifestCopyPath, text, len))
  {
    Log(kError, "couldn't store manifest copy %s", self->m_ManifestCopyPath);
    return false;
  }
  return true;
}

bool StoredManifestLoad(const ValidationState* self, MemAllocHeap* heap, Buffer<char>* text_out)
{
  return BufferReadFile(text_out, heap, self->m_ManifestCopyPath);
}

}
