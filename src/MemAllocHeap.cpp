#include "MemAllocHeap.hpp"
#include "Atomic.hpp"

#include <stdlib.h>

namespace sf
{

void HeapInit(MemAllocHeap* heap)
{
  heap->m_AllocationCount = 0;
}

void HeapDestroy(MemAllocHeap* heap)
{
  if (heap->m_AllocationCount != 0)
    Log(kDebug, "heap destroyed with %u live allocations", heap->m_AllocationCount);
}

void* HeapAllocate(MemAllocHeap* heap, size_t size)
{
  void* ptr = malloc(size ? size : 1);
  if (!ptr)
    Croak("out of memory allocating %d bytes", (int) size);

  AtomicIncrement(&heap->m_AllocationCount);
  return ptr;
}

void HeapFree(MemAllocHeap* heap, const void *ptr)
{
  if (!ptr)
    return;

  __sync_sub_and_fetch(&heap->m_AllocationCount, 1);
  free((void*) ptr);
}

void* HeapReallocate(MemAllocHeap *heap, void *ptr, size_t size)
{
  if (0 == size)
  {
    HeapFree(heap, ptr);
    return nullptr;
  }

  void* new_ptr = realloc(ptr, size);

  if (!new_ptr)
  {
    Croak("out of memory reallocating %d bytes at %p", (int) size, ptr);
  }

  if (!ptr && new_ptr)
    AtomicIncrement(&heap->m_AllocationCount);

  return new_ptr;
}

}
