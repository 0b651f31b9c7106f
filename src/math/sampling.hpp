#pragma once

#include <ImathVec.h>

#include <algorithm>
#include <cmath>

namespace sample {
  namespace hemisphere {
    /* cosine weighted direction around the local y axis */
    inline Imath::V3f cosine_weighted(const Imath::V2f& sample) {
      const float r = std::sqrt(sample.x);
      const float theta = 2 * M_PI * sample.y;

      const float x = r * std::cos(theta);
      const float z = r * std::sin(theta);

      return Imath::V3f(x, std::sqrt(std::max(0.0f, 1.0f - sample.x)), z);
    }
  }

  namespace sphere {
    /* uniformly distributed point inside the unit ball, from three
     * uniform numbers in [0,1) */
    inline Imath::V3f uniform_ball(float u0, float u1, float u2) {
      const float z   = 1.0f - 2.0f * u0;
      const float r   = std::sqrt(std::max(0.0f, 1.0f - z * z));
      const float phi = 2 * M_PI * u1;
      const float s   = std::cbrt(u2);

      return Imath::V3f(r * std::cos(phi), r * std::sin(phi), z) * s;
    }
  }
}
