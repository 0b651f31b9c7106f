#pragma once

#include "utils/color.hpp"

#include <cstdint>

struct allocator_t;

/* A worker local accumulation buffer for a single tile. It holds the
 * color sums and sample counts of the samples taken during one pass
 * over the tile, before they get committed to the film in one go */
struct render_buffer_t {
  float*    sums;   // three floats per pixel, linear rgb
  uint32_t* counts; // samples per pixel

  uint32_t width;  // width of the render buffer in pixels
  uint32_t height; // height of the render buffer in pixels

  uint32_t xstride; // size of a single pixel in the buffer
  uint32_t ystride; // size of a line in the buffer

  render_buffer_t();

  /* add a sample to a pixel in the render buffer */
  void add(uint32_t x, uint32_t y, const Imath::Color3f& c);

  Imath::Color3f sum(uint32_t x, uint32_t y) const;

  uint32_t count(uint32_t x, uint32_t y) const;

  /* get memory for a tile of a given size from the allocator, and
   * clear it */
  void allocate(allocator_t& allocator, uint32_t width, uint32_t height);
};
