#pragma once

#include <algorithm>
#include <cmath>

namespace fresnel {
  /* reflectance at normal incidence, between two media with refractive
   * indices n1 and n2 */
  inline float r0(float n1, float n2) {
    const auto r = (n1 - n2) / (n1 + n2);
    return r * r;
  }

  inline float schlick_weight(float cos_theta) {
    const auto m = std::clamp(1.0f - cos_theta, 0.0f, 1.0f);
    return (m * m) * (m * m) * m;
  }

  /* Schlick's approximation of the fresnel reflectance of a dielectric
   * interface, for light arriving at cos_theta from the n1 side */
  inline float schlick(float cos_theta, float n1, float n2) {
    const auto f0 = r0(n1, n2);
    return f0 + (1.0f - f0) * schlick_weight(cos_theta);
  }
}
