#ifndef SNAPFETCH_HASH_HPP
#define SNAPFETCH_HASH_HPP

#include "Common.hpp"

#include <cstring>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace sf
{

// SHA-256 digest data
union HashDigest
{
  uint64_t m_Words64[4];
  uint8_t  m_Data[32];
};

static_assert(sizeof(HashDigest) == 32, "struct layout");

inline bool operator==(const HashDigest& lhs, const HashDigest& rhs)
{
  return 0 == memcmp(lhs.m_Data, rhs.m_Data, sizeof lhs.m_Data);
}

inline bool operator!=(const HashDigest& lhs, const HashDigest& rhs)
{
  return !(lhs == rhs);
}

// Streaming SHA-256 state backed by an OpenSSL digest context.
struct HashState
{
  EVP_MD_CTX* m_Context;
};

// Initialize hashing state.
void HashInit(HashState* h);

// Add arbitrary data to be hashed.
void HashUpdate(HashState* h, const void* data, size_t size);

// Finalize hash and obtain hash digest.
// HashState should not be used after this.
void HashFinalize(HashState* h, HashDigest* digest);

// Release hashing state without producing a digest.
void HashDiscard(HashState* h);

enum
{
  kDigestStringSize = 2 * sizeof(HashDigest) + 1
};

// Generate null-terminated lowercase hex string representation from a hash digest.
void DigestToString(char (&buffer)[kDigestStringSize], const HashDigest& digest);

// Parse a hex digest (either case). Returns false unless the string is exactly
// 64 hex digits.
bool DigestFromString(HashDigest* digest_out, const char* str);

// Like DigestFromString, for a string that is not null terminated.
bool DigestFromStringN(HashDigest* digest_out, const char* str, size_t len);

}

#endif
