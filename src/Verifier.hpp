#ifndef SNAPFETCH_VERIFIER_HPP
#define SNAPFETCH_VERIFIER_HPP

#include "Common.hpp"
#include "FileInfo.hpp"
#include "Hash.hpp"

namespace sf
{

struct ChecksumCache;

namespace VerifyStatus
{
  enum Enum
  {
    kSuccess  = 0,
    kMismatch = 1,   // file read fine, content hash differs
    kIoError  = 2,   // missing or unreadable file
    kCount
  };

  extern const char* Names[kCount];
}

struct VerifyRequest
{
  const char* m_Filename;
  const char* m_ExpectedChecksum;
};

// Result of verifying one file. m_ActualChecksum is valid for kSuccess and
// kMismatch; m_Errno for kIoError.
struct VerifyOutcome
{
  VerifyStatus::Enum m_Status;
  const char*        m_Filename;
  const char*        m_ExpectedChecksum;
  char               m_ActualChecksum[kDigestStringSize];
  int                m_Errno;
  bool               m_CacheHit;
};

// Hash the full contents of a file. *info_out receives the fingerprint of the
// file that was actually read. Returns false with *errno_out set if the file
// can't be opened or read.
bool ComputeFileDigest(const char* filename, HashDigest* digest_out, FileInfo* info_out, int* errno_out);

// Check one file against its expected checksum, going through the cache.
// The file itself is never modified.
void VerifyFile(ChecksumCache* cache, const VerifyRequest* request, VerifyOutcome* outcome);

}

#endif
