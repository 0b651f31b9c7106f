#pragma once

#include "entities/camera.hpp"
#include "state.hpp"
#include "math/trigonometry.hpp"

#include <cmath>

namespace camera {
  /* generates primary rays of a pinhole camera. the view plane is set up
   * once, and can then be shared among all workers */
  struct pinhole_kernel_t {
    Imath::V3f origin;
    Imath::V3f upper_left;
    Imath::V3f horizontal;
    Imath::V3f vertical;

    float stepx;
    float stepy;

    inline explicit pinhole_kernel_t(const camera_t& camera)
      : origin(camera.position)
      , stepx(1.0f / (float) camera.film.width)
      , stepy(1.0f / (float) camera.film.height)
    {
      const auto ratio = (float) camera.film.width / (float) camera.film.height;

      const auto h = std::tan(trig::radians(camera.fov) * 0.5f);
      const auto height = 2.0f * h;
      const auto width  = ratio * height;

      const auto w = (camera.position - camera.at).normalized();
      const auto u = camera.up.cross(w).normalized();
      const auto v = w.cross(u);

      horizontal = u * width;
      vertical   = -v * height;
      upper_left = -w - horizontal * 0.5f - vertical * 0.5f;
    }

    /* ray through pixel (x, y), offset by a jitter in [0,1)^2. y grows
     * downwards on the film */
    inline ray_t operator()(uint32_t x, uint32_t y, const Imath::V2f& jitter) const {
      const auto s = (x + jitter.x) * stepx;
      const auto t = (y + jitter.y) * stepy;

      const auto d = upper_left + horizontal * s + vertical * t;
      return ray_t(origin, d.normalized());
    }
  };
}
