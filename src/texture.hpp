#pragma once

#include "utils/color.hpp"

#include <ImathVec.h>

#include <cstdint>
#include <string>
#include <vector>

/* A 2d grid of linear rgb texels, looked up by texture coordinates. The
 * coordinates wrap around in both directions, v=0 is the bottom row of
 * the image */
struct texture_t {
  enum class filter_t {
    Nearest,
    Bilinear
  };

  uint32_t width;
  uint32_t height;

  filter_t filter;

  // row major, top row first
  std::vector<Imath::Color3f> texels;

  inline texture_t()
    : width(0)
    , height(0)
    , filter(filter_t::Bilinear)
  {}

  texture_t(
    uint32_t width
  , uint32_t height
  , const std::vector<Imath::Color3f>& texels
  , filter_t filter = filter_t::Bilinear);

  /* fetch a single texel, with wrap around addressing */
  Imath::Color3f texel(int64_t x, int64_t y) const;

  Imath::Color3f sample(const Imath::V2f& uv) const;

  /* decode an image file with OpenImageIO. throws if the file can't be
   * read */
  static texture_t load(const std::string& path, filter_t filter);
};
