#pragma once

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-register"
#include <ImathColor.h>
#pragma clang diagnostic pop

#include <algorithm>
#include <cmath>

namespace color {
  inline bool is_black(const Imath::Color3f& c) {
    return c.x == 0.0f && c.y == 0.0f && c.z == 0.0f;
  }

  inline bool is_finite(const Imath::Color3f& c) {
    return std::isfinite(c.x) && std::isfinite(c.y) && std::isfinite(c.z);
  }

  inline float max(const Imath::Color3f& c) {
    return std::max(c.x, std::max(c.y, c.z));
  }

  inline Imath::Color3f lerp(const Imath::Color3f& a, const Imath::Color3f& b, float t) {
    return a * (1.0f - t) + b * t;
  }

  /* gamma 2 encoding for display referred outputs */
  inline Imath::Color3f gamma2(const Imath::Color3f& c) {
    return Imath::Color3f(
      std::sqrt(std::max(0.0f, c.x))
    , std::sqrt(std::max(0.0f, c.y))
    , std::sqrt(std::max(0.0f, c.z)));
  }
}
