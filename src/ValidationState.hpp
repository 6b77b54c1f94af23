#ifndef SNAPFETCH_VALIDATIONSTATE_HPP
#define SNAPFETCH_VALIDATIONSTATE_HPP

#include "Common.hpp"
#include "Buffer.hpp"

namespace sf
{

struct MemAllocHeap;
struct VerifyOutcome;

// Locations of the files that persist validation progress in a working
// directory.
struct ValidationState
{
  char m_CachePath[kMaxPathLength];
  char m_LedgerPath[kMaxPathLength];
  char m_MarkerPath[kMaxPathLength];
  char m_ManifestCopyPath[kMaxPathLength];
};

void ValidationStateInit(ValidationState* self, const char* dir);

//-----------------------------------------------------------------------------
// Validation marker: exists only after a pass in which every file verified.
//-----------------------------------------------------------------------------

bool ValidationMarkerExists(const ValidationState* self);

// The content is an informational summary; only the file's existence matters.
bool ValidationMarkerWrite(const ValidationState* self, const VerifyOutcome* outcomes, int count, MemAllocHeap* heap);

bool ValidationMarkerRemove(const ValidationState* self);

//-----------------------------------------------------------------------------
// Failure ledger: "filename|expected checksum" for each file that failed the
// most recent pass.
//-----------------------------------------------------------------------------

struct LedgerEntry
{
  const char* m_Filename;
  const char* m_ExpectedChecksum;
};

struct FailureLedger
{
  MemAllocHeap*       m_Heap;
  Buffer<char>        m_Text;
  Buffer<LedgerEntry> m_Entries;
};

void FailureLedgerInit(FailureLedger* self, MemAllocHeap* heap);
void FailureLedgerDestroy(FailureLedger* self);

// Replace the ledger with the failed entries among `outcomes`.
bool FailureLedgerWrite(const ValidationState* state, const VerifyOutcome* outcomes, int count, MemAllocHeap* heap);

// A missing ledger loads as empty. Malformed lines are skipped with a warning.
bool FailureLedgerLoad(FailureLedger* self, const ValidationState* state);

bool FailureLedgerRemove(const ValidationState* state);

//-----------------------------------------------------------------------------
// Stored manifest: verbatim copy of the last manifest this directory was
// validated against.
//-----------------------------------------------------------------------------

// True if a stored copy exists and is byte-identical to `text`.
bool StoredManifestMatches(const ValidationState* self, const char* text, size_t len, MemAllocHeap* heap);

bool StoredManifestStore(const ValidationState* self, const char* text, size_t len);

// Returns false with errno set if there is no readable stored copy.
bool StoredManifestLoad(const ValidationState* self, MemAllocHeap* heap, Buffer<char>* text_out);

}

#endif
