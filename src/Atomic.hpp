#ifndef SNAPFETCH_ATOMIC_HPP
#define SNAPFETCH_ATOMIC_HPP

#include "Common.hpp"

namespace sf
{
  inline uint32_t AtomicIncrement(uint32_t* value)
  {
    return __sync_add_and_fetch(value, 1);
  }

  inline uint64_t AtomicAdd(uint64_t* ptr, uint64_t value)
  {
    return __sync_add_and_fetch(ptr, value);
  }

  inline uint32_t AtomicLoad(uint32_t* value)
  {
    return __sync_add_and_fetch(value, 0);
  }
}

#endif
