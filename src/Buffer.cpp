#include "Buffer.hpp"

#include <cstdarg>
#include <cstdio>
#include <errno.h>

namespace sf
{

void BufferAppendString(Buffer<char>* buffer, MemAllocHeap* heap, const char* str)
{
  BufferAppend(buffer, heap, str, strlen(str));
}

void BufferAppendFormat(Buffer<char>* buffer, MemAllocHeap* heap, const char* fmt, ...)
{
  char tmp[1024];

  va_list args;
  va_start(args, fmt);
  int len = vsnprintf(tmp, sizeof tmp, fmt, args);
  va_end(args);

  if (len < 0)
    return;

  if (size_t(len) < sizeof tmp)
  {
    BufferAppend(buffer, heap, tmp, size_t(len));
    return;
  }

  // Didn't fit the scratch space; format straight into the buffer.
  size_t old_size = buffer->m_Size;
  char* dest = BufferAlloc(buffer, heap, size_t(len) + 1);
  va_start(args, fmt);
  vsnprintf(dest, size_t(len) + 1, fmt, args);
  va_end(args);
  buffer->m_Size = old_size + size_t(len);
}

const char* BufferCString(Buffer<char>* buffer, MemAllocHeap* heap)
{
  BufferAppendOne(buffer, heap, '\0');
  --buffer->m_Size;
  return buffer->m_Storage;
}

bool BufferReadFile(Buffer<char>* buffer, MemAllocHeap* heap, const char* path)
{
  FILE* f = fopen(path, "rb");
  if (!f)
    return false;

  size_t old_size = buffer->m_Size;
  char chunk[8192];

  while (size_t nbytes = fread(chunk, 1, sizeof chunk, f))
    BufferAppend(buffer, heap, chunk, nbytes);

  if (ferror(f))
  {
    int err = errno;
    fclose(f);
    buffer->m_Size = old_size;
    errno = err ? err : EIO;
    return false;
  }

  fclose(f);
  return true;
}

}
