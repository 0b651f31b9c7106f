#pragma once

#include "utils/nocopy.hpp"

#include <atomic>
#include <cstdint>

struct parsed_options_t;
struct scene_t;

/**
 * Drives a progressive render. The image is rendered in passes, every
 * pass adds samples to all pixels of a memory mapped buffer, until the
 * requested sample count is reached, or the render gets stopped. A
 * stopped render can be continued later from the buffer
 */
struct renderer_t : nocopy_t {
  std::atomic<bool> stop_requested;

  renderer_t();

  /* render a scene into the buffer at options.output. returns true if
   * the sample target was reached, false if the render got stopped.
   * throws on invalid scenes, and buffers that can't be opened or
   * resumed, before any rendering starts */
  bool render(const scene_t& scene, const parsed_options_t& options);

  /* request the render to halt after the tiles in flight. safe to call
   * from any thread, and from signal handlers */
  void stop();
};
