#pragma once

#include "accel/bvh/builder.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

/* Parsed command line options */
struct parsed_options_t {
  static const uint32_t DEFAULT_SAMPLES_PER_PIXEL = 16;
  static const uint32_t DEFAULT_SAMPLES_PER_PASS = 1;
  static const uint32_t DEFAULT_PATH_DEPTH = 9;
  static const uint32_t DEFAULT_TILE_SIZE = 32;

  std::string scene;
  // path of the progressive buffer
  std::string output;
  // optional image, the final buffer gets exported to
  std::string image;

  // only use one host thread
  bool single_threaded;
  // continue rendering into an existing buffer
  bool resume;
  // pin worker threads to cores
  bool affinity;
  // print statistics while rendering
  bool verbose;
  // number of worker threads, 0 uses all cores
  uint32_t threads;
  // number of pixel samples, the render stops at
  uint32_t samples_per_pixel;
  // samples added to every pixel by one pass
  uint32_t samples_per_pass;
  // maximum depth of traced paths
  uint32_t path_depth;
  // depth from which on paths get terminated by russian roulette, 0
  // disables it
  uint32_t roulette_depth;
  uint32_t tile_size;
  // film size overrides, 0 keeps the size from the scene
  uint32_t width;
  uint32_t height;
  // base seed of all random streams
  uint64_t seed;
  // how the BVH divides primitives among children
  bvh::policy_t split;

  inline parsed_options_t()
    : output("out.film")
    , single_threaded(false)
    , resume(false)
    , affinity(false)
    , verbose(false)
    , threads(0)
    , samples_per_pixel(DEFAULT_SAMPLES_PER_PIXEL)
    , samples_per_pass(DEFAULT_SAMPLES_PER_PASS)
    , path_depth(DEFAULT_PATH_DEPTH)
    , roulette_depth(0)
    , tile_size(DEFAULT_TILE_SIZE)
    , width(0)
    , height(0)
    , seed(0)
    , split(bvh::policy_t::Sah)
  {}
};

namespace args {
  /* parse the decimal value of a numeric option. anything but digits,
   * and values above 'max' throw */
  inline uint64_t number(
    const std::string& name
  , const char* arg
  , uint64_t max = std::numeric_limits<uint32_t>::max())
  {
    if (!std::isdigit((unsigned char) *arg)) {
      throw std::runtime_error("Invalid " + name + ": " + arg);
    }

    errno = 0;
    char* end;
    const auto n = std::strtoull(arg, &end, 10);
    if (*end != '\0' || errno == ERANGE || n > max) {
      throw std::runtime_error("Invalid " + name + ": " + arg);
    }
    return n;
  }
}
