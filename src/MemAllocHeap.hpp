#ifndef SNAPFETCH_MEMALLOCHEAP_HPP
#define SNAPFETCH_MEMALLOCHEAP_HPP

#include "Common.hpp"

#include <string.h>

namespace sf
{

// General purpose allocator handle. Everything that owns heap memory takes
// one of these so allocation stays explicit at the call sites.
struct MemAllocHeap
{
  uint32_t m_AllocationCount;
};

void HeapInit(MemAllocHeap* heap);
void HeapDestroy(MemAllocHeap* heap);

void* HeapAllocate(MemAllocHeap* heap, size_t size);

void HeapFree(MemAllocHeap* heap, const void *ptr);

void* HeapReallocate(MemAllocHeap* heap, void *ptr, size_t size);

template <typename T>
T* HeapAllocateArray(MemAllocHeap* heap, size_t count)
{
  return (T*) HeapAllocate(heap, sizeof(T) * count);
}

template <typename T>
T* HeapAllocateArrayZeroed(MemAllocHeap* heap, size_t count)
{
  T* result = HeapAllocateArray<T>(heap, count);
  memset(result, 0, sizeof(T) * count);
  return result;
}

}

#endif
