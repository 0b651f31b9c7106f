#include "light.hpp"
#include "math/vector.hpp"

#include <cmath>

bool light_t::setup_shadow_ray(
  const interaction_t& hit
, ray_t& ray
, Imath::Color3f& irradiance) const
{
  const auto p  = offset(hit.p, hit.ng);
  const auto wi = position - p;

  const auto d2 = wi.length2();
  if (!(d2 > 0.0f)) {
    return false;
  }

  const auto d = std::sqrt(d2);
  const auto l = wi / d;

  const auto cos_theta = l.dot(hit.n);
  if (cos_theta <= 0.0f || l.dot(hit.ng) <= 0.0f) {
    return false;
  }

  // stop just short of the light, nothing behind it can occlude
  ray = ray_t(p, l, 0.0f, d * (1.0f - RAY_EPSILON));
  irradiance = intensity * (cos_theta / d2);
  return true;
}

light_t light_t::make_point(const Imath::V3f& position, const Imath::Color3f& intensity) {
  return light_t{position, intensity};
}
