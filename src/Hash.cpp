#include "Hash.hpp"

#include <openssl/evp.h>

namespace sf
{

void HashInit(HashState* self)
{
  self->m_Context = EVP_MD_CTX_new();
  if (!self->m_Context)
    Croak("EVP_MD_CTX_new() failed");

  if (1 != EVP_DigestInit_ex(self->m_Context, EVP_sha256(), nullptr))
    Croak("EVP_DigestInit_ex() failed for sha256");
}

void HashUpdate(HashState* self, const void* data, size_t size)
{
  if (1 != EVP_DigestUpdate(self->m_Context, data, size))
    Croak("EVP_DigestUpdate() failed");
}

void HashFinalize(HashState* self, HashDigest* digest)
{
  unsigned int len = 0;
  if (1 != EVP_DigestFinal_ex(self->m_Context, digest->m_Data, &len) || len != sizeof digest->m_Data)
    Croak("EVP_DigestFinal_ex() failed");

  HashDiscard(self);
}

void HashDiscard(HashState* self)
{
  EVP_MD_CTX_free(self->m_Context);
  self->m_Context = nullptr;
}

void DigestToString(char (&buffer)[kDigestStringSize], const HashDigest& digest)
{
  static const char hex[] = "0123456789abcdef";

  for (size_t i = 0; i < sizeof digest.m_Data; ++i)
  {
    uint8_t byte = digest.m_Data[i];
    buffer[2 * i + 0] = hex[byte >> 4];
    buffer[2 * i + 1] = hex[byte & 0xf];
  }

  buffer[kDigestStringSize - 1] = '\0';
}

static int HexValue(char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool DigestFromStringN(HashDigest* digest_out, const char* str, size_t len)
{
  if (len != 2 * sizeof digest_out->m_Data)
    return false;

  for (size_t i = 0; i < sizeof digest_out->m_Data; ++i)
  {
    int hi = HexValue(str[2 * i + 0]);
    int lo = HexValue(str[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    digest_out->m_Data[i] = uint8_t((hi << 4) | lo);
  }

  return true;
}

bool DigestFromString(HashDigest* digest_out, const char* str)
{
  return DigestFromStringN(digest_out, str, strlen(str));
}

}
