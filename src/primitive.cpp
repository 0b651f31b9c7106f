#include "primitive.hpp"
#include "math/aabb.hpp"
#include "math/vector.hpp"

#include <cmath>

Imath::Box3f primitive_t::bounds() const {
  Imath::Box3f out;

  switch (type()) {
  case type_t::Sphere: {
    const auto& s = sphere();
    const auto r = std::fabs(s.radius);
    out.extendBy(s.center - Imath::V3f(r));
    out.extendBy(s.center + Imath::V3f(r));
    break;
  }
  case type_t::Triangle: {
    const auto& t = triangle();
    out.extendBy(t.v[0]);
    out.extendBy(t.v[1]);
    out.extendBy(t.v[2]);
    break;
  }
  case type_t::Plane:
    return out;
  }

  return aabb::pad(out);
}

bool primitive_t::is_finite() const {
  switch (type()) {
  case type_t::Sphere:
    return ::is_finite(sphere().center) && std::isfinite(sphere().radius);
  case type_t::Plane:
    return ::is_finite(plane().point) && ::is_finite(plane().normal);
  case type_t::Triangle: {
    const auto& t = triangle();
    for (auto i=0; i<3; ++i) {
      if (!::is_finite(t.v[i])) {
        return false;
      }
      if (t.has_normals && !::is_finite(t.n[i])) {
        return false;
      }
    }
    return true;
  }
  }
  return false;
}

primitive_t primitive_t::make_sphere(
  const Imath::V3f& center
, float radius
, uint32_t material)
{
  return { sphere_t{center, radius}, material };
}

primitive_t primitive_t::make_plane(
  const Imath::V3f& point
, const Imath::V3f& normal
, uint32_t material)
{
  // a zero normal stays zero, every ray misses such a plane
  const auto n = near_zero(normal) ? normal : normal.normalized();
  return { plane_t{point, n}, material };
}

primitive_t primitive_t::make_triangle(
  const Imath::V3f& a
, const Imath::V3f& b
, const Imath::V3f& c
, uint32_t material)
{
  const Imath::V3f v[3] = { a, b, c };
  return make_triangle(v, nullptr, nullptr, material);
}

primitive_t primitive_t::make_triangle(
  const Imath::V3f (&v)[3]
, const Imath::V3f* n
, const Imath::V2f* uv
, uint32_t material)
{
  triangle_t t;
  t.has_normals = n != nullptr;
  t.has_uvs = uv != nullptr;

  for (auto i=0; i<3; ++i) {
    t.v[i]  = v[i];
    t.n[i]  = n ? (near_zero(n[i]) ? n[i] : n[i].normalized()) : Imath::V3f(0.0f);
    t.uv[i] = uv ? uv[i] : Imath::V2f(0.0f);
  }

  return { t, material };
}
