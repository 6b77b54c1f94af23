#ifndef SNAPFETCH_MEMALLOCLINEAR_HPP
#define SNAPFETCH_MEMALLOCLINEAR_HPP

#include "Common.hpp"

#include <cstring>

namespace sf
{

struct MemAllocHeap;

// Bump allocator for strings that live as long as their owner (manifest
// entries, cache keys). Everything allocated from it is released at once by
// LinearAllocReset() or LinearAllocDestroy(). Not thread safe; owners that are
// shared between threads guard it with their own lock.
struct MemAllocLinear
{
  enum
  {
    kMaxAlignment     = 64
  };

  char*         m_BasePointer;    // allocated pointer
  char*         m_Pointer;        // aligned pointer
  size_t        m_Size;
  size_t        m_Offset;
  MemAllocHeap* m_BackingHeap;
  size_t        m_PeakOffset;     // high water mark across resets
  const char*   m_DebugName;
};

void LinearAllocInit(MemAllocLinear* allocator, MemAllocHeap* heap, size_t max_size, const char* debug_name);

void LinearAllocDestroy(MemAllocLinear* allocator);

void* LinearAllocate(MemAllocLinear* allocator, size_t size, size_t align);

// Like LinearAllocate(), but returns nullptr instead of terminating when the
// allocator is full.
void* LinearTryAllocate(MemAllocLinear* allocator, size_t size, size_t align);

void LinearAllocReset(MemAllocLinear* allocator);

class MemAllocLinearScope
{
  MemAllocLinear* m_Allocator;
  size_t          m_Offset;

public:
  explicit MemAllocLinearScope(MemAllocLinear* a)
  : m_Allocator(a)
  , m_Offset(a->m_Offset)
  {
  }

  ~MemAllocLinearScope()
  {
    m_Allocator->m_Offset = m_Offset;
  }

private:
  MemAllocLinearScope(const MemAllocLinearScope&);
  MemAllocLinearScope& operator=(const MemAllocLinearScope&);
};

template <typename T>
T* LinearAllocate(MemAllocLinear *allocator)
{
  return static_cast<T*>(LinearAllocate(allocator, sizeof(T), ALIGNOF(T)));
}

template <typename T>
T* LinearAllocateArray(MemAllocLinear *allocator, size_t count)
{
  return static_cast<T*>(LinearAllocate(allocator, sizeof(T) * count, ALIGNOF(T)));
}

inline char* StrDupN(MemAllocLinear* allocator, const char* str, size_t len)
{
  char* buffer = static_cast<char*>(LinearAllocate(allocator, len + 1, 1));
  memcpy(buffer, str, len);
  buffer[len] = '\0';
  return buffer;
}

inline char* StrDup(MemAllocLinear* allocator, const char* str)
{
  return StrDupN(allocator, str, strlen(str));
}

}

#endif
