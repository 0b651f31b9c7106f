#pragma once

#include "math/vector.hpp"

#include <ImathVec.h>

#include <cstdint>
#include <limits>

/* Models a ray as it gets traced through the scene. a ray is only
 * valid for distances in [tmin, tmax] */
struct ray_t {
  Imath::V3f p;
  Imath::V3f wi;
  float tmin;
  float tmax;

  inline ray_t()
    : p(0.0f)
    , wi(0.0f)
    , tmin(0.0f)
    , tmax(std::numeric_limits<float>::max())
  {}

  inline ray_t(
    const Imath::V3f& p
  , const Imath::V3f& wi
  , float tmin = 0.0f
  , float tmax = std::numeric_limits<float>::max())
    : p(p), wi(wi), tmin(tmin), tmax(tmax)
  {}

  inline Imath::V3f at(float t) const {
    return p + wi * t;
  }

  /* rays with a NaN, or zero length direction never hit anything, so
   * they can't poison the image with invalid values */
  inline bool is_valid() const {
    return ::is_finite(p)
      && ::is_finite(wi)
      && wi.length2() > 0.0f
      && !(tmin > tmax);
  }
};

/**
 * A surface interaction models a point on a surface at which a ray has
 * intersected a surface (the hit record). Both normals point against the
 * incoming ray. The geometric normal decides front and back facing, the
 * shading normal is used by the materials, and differs from the geometric
 * one only for triangles with vertex normals
 */
struct interaction_t {
  float t;

  Imath::V3f p;
  Imath::V3f ng;
  Imath::V3f n;
  Imath::V2f st;

  // barycentric coordinates of the hit on a triangle, (w, u, v)
  Imath::V3f barycentrics;

  uint32_t material;
  uint32_t primitive;

  bool front_face;

  inline interaction_t()
    : t(std::numeric_limits<float>::max())
    , p(0.0f)
    , ng(0.0f)
    , n(0.0f)
    , st(0.0f)
    , barycentrics(0.0f)
    , material(0)
    , primitive(0)
    , front_face(true)
  {}

  /* orient the outward facing normals of a surface against the ray */
  inline void set_face_normal(
    const ray_t& ray
  , const Imath::V3f& outward_ng
  , const Imath::V3f& outward_n)
  {
    front_face = ray.wi.dot(outward_ng) < 0.0f;
    ng = front_face ? outward_ng : -outward_ng;
    n  = front_face ? outward_n : -outward_n;

    // interpolated normals may point away from the ray near silhouettes
    if (n.dot(ng) < 0.0f) {
      n = ng;
    }
  }
};
