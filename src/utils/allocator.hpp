#pragma once

#include <cstdint>
#include <cstdlib>
#include <new>
#include <stdexcept>

/**
 * Memory for a tile is allocated per worker up front, and handed out
 * sequentially while a tile gets rendered. We organize it as a stack
 * instead of using the heap directly, so a tile never touches malloc
 */
struct allocator_t {
  static const size_t ALIGNMENT = 32;

  char*  mem;
  char*  pos;
  size_t size;

  inline allocator_t(size_t size)
    : mem(nullptr)
    , pos(nullptr)
    , size(size)
  {
    if (posix_memalign((void**) &mem, ALIGNMENT, size) != 0) {
      throw std::bad_alloc();
    }
    pos = mem;
  }

  inline ~allocator_t() {
    free(mem);
    mem = pos = nullptr;
  }

  allocator_t(const allocator_t&) = delete;
  allocator_t& operator=(const allocator_t&) = delete;

  inline char* allocate(size_t bytes) {
    // keep allocations 32 byte aligned
    const auto misalignment = ((uintptr_t) pos) % ALIGNMENT;
    const auto padding = misalignment ? ALIGNMENT - misalignment : 0;

    if (used() + bytes + padding > size) {
      throw std::runtime_error("Out of memory in tile allocator");
    }
    pos += padding;
    char* out = pos;
    pos += bytes;

    return out;
  }

  inline void reset() {
    pos = mem;
  }

  inline size_t used() const {
    return (pos - mem);
  }
};

struct allocator_scope_t {
  allocator_t& a;
  char*        start;

  inline allocator_scope_t(allocator_t& a)
    : a(a), start(a.pos)
  {}

  inline ~allocator_scope_t() {
    a.pos = start;
  }
};
