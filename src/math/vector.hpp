#pragma once

#include <ImathVec.h>

#include <algorithm>
#include <cmath>

static const float RAY_EPSILON = 0.0001f;

/* move a point off a surface along the normal, to avoid self intersection
 * of rays leaving the surface */
inline Imath::V3f offset(
  const Imath::V3f& p
, const Imath::V3f& n
, bool invert = false)
{
  const auto off = invert ? -RAY_EPSILON : RAY_EPSILON;
  return p + n * off;
}

inline bool is_finite(const Imath::V3f& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline bool near_zero(const Imath::V3f& v) {
  static const float eps = 1e-8f;
  return std::fabs(v.x) < eps && std::fabs(v.y) < eps && std::fabs(v.z) < eps;
}

/* mirror v about the normal n */
inline Imath::V3f reflect(const Imath::V3f& v, const Imath::V3f& n) {
  return v - n * (2.0f * v.dot(n));
}

/* bend the unit vector v through a surface with normal n, where eta is the
 * ratio of refractive indices on the incoming and outgoing side. returns
 * false on total internal reflection */
inline bool refract(
  const Imath::V3f& v
, const Imath::V3f& n
, float eta
, Imath::V3f& out)
{
  const auto cos_theta = std::min(-v.dot(n), 1.0f);
  const auto sin2_theta = std::max(0.0f, 1.0f - cos_theta * cos_theta);

  if (eta * eta * sin2_theta > 1.0f) {
    return false;
  }

  const auto perp     = (v + n * cos_theta) * eta;
  const auto parallel = n * -std::sqrt(std::fabs(1.0f - perp.length2()));

  out = perp + parallel;
  return true;
}
