#include "sampling.hpp"

namespace sampling {
  namespace {
    // splitmix64 finalizer
    inline uint64_t mix(uint64_t z) {
      z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
      z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
      return z ^ (z >> 31);
    }
  }

  uint64_t seed(uint64_t base, uint32_t x, uint32_t y, uint32_t index) {
    auto h = mix(base + 0x9e3779b97f4a7c15ull);
    h = mix(h ^ ((uint64_t) x << 32 | y));
    h = mix(h ^ index);
    return h;
  }
}
