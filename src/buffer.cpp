#include "buffer.hpp"

#include "utils/allocator.hpp"

#include <cstring>

render_buffer_t::render_buffer_t()
  : sums(nullptr)
  , counts(nullptr)
  , width(0)
  , height(0)
  , xstride(3)
  , ystride(0)
{}

void render_buffer_t::add(uint32_t x, uint32_t y, const Imath::Color3f& c) {
  const auto index = y * ystride + x * xstride;
  sums[index    ] += c.x;
  sums[index + 1] += c.y;
  sums[index + 2] += c.z;

  counts[y * width + x]++;
}

Imath::Color3f render_buffer_t::sum(uint32_t x, uint32_t y) const {
  const auto index = y * ystride + x * xstride;
  return Imath::Color3f(sums[index], sums[index + 1], sums[index + 2]);
}

uint32_t render_buffer_t::count(uint32_t x, uint32_t y) const {
  return counts[y * width + x];
}

void render_buffer_t::allocate(allocator_t& allocator, uint32_t _width, uint32_t _height) {
  width = _width;
  height = _height;
  ystride = xstride * width;

  const auto sums_size = height * ystride * sizeof(float);
  const auto counts_size = width * height * sizeof(uint32_t);

  sums = (float*) allocator.allocate(sums_size);
  memset(sums, 0, sums_size);

  counts = (uint32_t*) allocator.allocate(counts_size);
  memset(counts, 0, counts_size);
}
