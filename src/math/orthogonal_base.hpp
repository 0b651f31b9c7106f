#pragma once

#include <ImathVec.h>

#include <cmath>

/* An orthonormal frame around a unit normal. local directions use the
 * normal as their y axis, the way the hemisphere samplers produce them */
struct orthogonal_base_t {
  Imath::V3f t; // tangent
  Imath::V3f n;
  Imath::V3f b; // bitangent

  inline orthogonal_base_t(const Imath::V3f& normal)
    : n(normal)
  {
    // branchless frame of Duff et al., without the singularity at -z
    const float sign = std::copysign(1.0f, n.z);
    const float a = -1.0f / (sign + n.z);
    const float d = n.x * n.y * a;

    t = Imath::V3f(1.0f + sign * n.x * n.x * a, sign * d, -sign * n.x);
    b = Imath::V3f(d, sign + n.y * n.y * a, -n.y);
  }

  inline Imath::V3f to_world(const Imath::V3f& v) const {
    return t * v.x + n * v.y + b * v.z;
  }

  inline Imath::V3f to_local(const Imath::V3f& v) const {
    return Imath::V3f(v.dot(t), v.dot(n), v.dot(b));
  }
};
