#pragma once

#include <cmath>

namespace trig {
  inline constexpr float radians(float a) {
    return a * float(M_PI / 180.0);
  }

  inline float clamped_cos(float cos_theta) {
    return std::fmin(std::fmax(cos_theta, -1.0f), 1.0f);
  }
}
