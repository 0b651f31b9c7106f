#pragma once

#include "utils/color.hpp"

#include <ImathVec.h>

#include <cstdint>

struct render_buffer_t;

/* Receives the samples of finished tiles */
struct film_t {
  virtual ~film_t()
  {}

  /* Add radiance sample values to film */
  virtual void add_tile(
    const Imath::V2i& pos
  , const Imath::V2i& size
  , const render_buffer_t& buffer) = 0;

  /* number of samples accumulated in a pixel so far */
  virtual uint32_t samples(uint32_t x, uint32_t y) const = 0;
};
