#pragma once

#include <ImathVec.h>

#include <cstdint>
#include <limits>

namespace sampling {
  /* wyrand, a small generator with a single 64 bit word of state. it
   * complies with the standard's random bit generator requirements */
  struct wyrand_t {
    typedef uint64_t result_type;

    uint64_t state;

    inline explicit wyrand_t(uint64_t seed)
      : state(seed)
    {}

    static constexpr uint64_t min() {
      return std::numeric_limits<uint64_t>::min();
    }

    static constexpr uint64_t max() {
      return std::numeric_limits<uint64_t>::max();
    }

    inline uint64_t operator()() {
      state += 0x2d358dccaa6c78a5ull;
      const auto t = (unsigned __int128) state * (state ^ 0x8bb84b93962eacc9ull);
      return (uint64_t) (t >> 64) ^ (uint64_t) t;
    }
  };

  /* mixes the coordinates of a sample into a seed, so every sample of
   * every pixel gets an independent stream */
  uint64_t seed(uint64_t base, uint32_t x, uint32_t y, uint32_t index);
}

/* The random stream of one pixel sample. The stream only depends on the
 * base seed, the pixel, and the index of the sample in that pixel, so a
 * render that gets interrupted and resumed draws the same numbers as an
 * uninterrupted one */
struct sampler_t {
  sampling::wyrand_t gen;

  inline sampler_t(uint64_t base, uint32_t x, uint32_t y, uint32_t index)
    : gen(sampling::seed(base, x, y, index))
  {}

  /* uniform float in [0,1) */
  inline float sample() {
    // the upper 24 bits fit exactly into the float mantissa
    return (gen() >> 40) * (1.0f / 16777216.0f);
  }

  inline Imath::V2f sample2() {
    const auto a = sample();
    const auto b = sample();
    return { a, b };
  }
};
