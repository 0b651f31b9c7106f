#pragma once

#include <ImathVec.h>

#include <cstdint>

/* The camera data model, used by the rest of the rendering 
 * system. a pinhole camera, looking from 'position' at 'at' */
struct camera_t {
  Imath::V3f position;
  Imath::V3f at;
  Imath::V3f up;

  // vertical field of view in degrees
  float fov;

  struct film_t {
    uint32_t width;
    uint32_t height;

    inline film_t()
      : width(1280)
      , height(720)
    {}
  } film;

  inline camera_t()
    : position(0.0f, 0.0f, 0.0f)
    , at(0.0f, 0.0f, -1.0f)
    , up(0.0f, 1.0f, 0.0f)
    , fov(90.0f)
  {}
};
