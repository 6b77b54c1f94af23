#include "MemAllocLinear.hpp"
#include "MemAllocHeap.hpp"

namespace sf
{

void LinearAllocInit(MemAllocLinear* self, MemAllocHeap* heap, size_t max_size, const char* debug_name)
{
  size_t alloc_size = max_size + MemAllocLinear::kMaxAlignment - 1;
  self->m_BasePointer = static_cast<char*>(HeapAllocate(heap, alloc_size));
  self->m_Size        = max_size;
  self->m_Offset      = 0;
  self->m_PeakOffset  = 0;
  self->m_BackingHeap = heap;
  self->m_DebugName   = debug_name;

  uintptr_t aligned_base = uintptr_t(self->m_BasePointer + MemAllocLinear::kMaxAlignment - 1) & ~uintptr_t(MemAllocLinear::kMaxAlignment - 1);

  self->m_Pointer     = reinterpret_cast<char*>(aligned_base);
}

void LinearAllocDestroy(MemAllocLinear* self)
{
  Log(kSpam, "%s: %d of %d bytes used at peak", self->m_DebugName, (int) self->m_PeakOffset, (int) self->m_Size);
  HeapFree(self->m_BackingHeap, self->m_BasePointer);
  self->m_BasePointer = nullptr;
  self->m_Pointer     = nullptr;
}

void* LinearTryAllocate(MemAllocLinear* self, size_t size, size_t align)
{
  // Alignment must be a non-zero power of two
  CHECK(align > 0);
  CHECK(0 == (align & (align - 1)));

  size_t offset = (self->m_Offset + align - 1) & ~(align - 1);

  if (offset > self->m_Size || size > self->m_Size - offset)
    return nullptr;

  self->m_Offset = offset + size;
  if (self->m_Offset > self->m_PeakOffset)
    self->m_PeakOffset = self->m_Offset;
  return self->m_Pointer + offset;
}

void* LinearAllocate(MemAllocLinear* self, size_t size, size_t align)
{
  void* result = LinearTryAllocate(self, size, align);
  if (!result)
    Croak("out of memory in linear allocator: %s (%d bytes requested)", self->m_DebugName, (int) size);
  return result;
}

void LinearAllocReset(MemAllocLinear* allocator)
{
  allocator->m_Offset = 0;
}

}
