#pragma once

#include <ImathBox.h>
#include <ImathVec.h>

#include <cstdint>
#include <variant>

/* Geometry of the scene. primitives are immutable once the scene is
 * loaded, and referenced by index from the leaves of the BVH */

struct sphere_t {
  Imath::V3f center;
  float      radius;
};

/* an infinite plane through 'point'. the normal is normalized on
 * construction */
struct plane_t {
  Imath::V3f point;
  Imath::V3f normal;
};

struct triangle_t {
  Imath::V3f v[3];
  // optional per vertex normals, used for smooth shading
  Imath::V3f n[3];
  // optional per vertex texture coordinates
  Imath::V2f uv[3];

  bool has_normals;
  bool has_uvs;

  inline Imath::V3f face_normal() const {
    return (v[1] - v[0]).cross(v[2] - v[0]);
  }
};

struct primitive_t {
  enum class type_t : uint8_t {
    Sphere   = 0,
    Plane    = 1,
    Triangle = 2
  };

  std::variant<sphere_t, plane_t, triangle_t> shape;

  // index of the material attached to this primitive
  uint32_t material;

  inline type_t type() const {
    return static_cast<type_t>(shape.index());
  }

  inline const sphere_t& sphere() const {
    return std::get<sphere_t>(shape);
  }

  inline const plane_t& plane() const {
    return std::get<plane_t>(shape);
  }

  inline const triangle_t& triangle() const {
    return std::get<triangle_t>(shape);
  }

  /* infinite primitives have no box, and can't be stored in the BVH */
  inline bool is_bounded() const {
    return type() != type_t::Plane;
  }

  /* padded bounding box of the primitive, empty for unbounded ones */
  Imath::Box3f bounds() const;

  /* false for geometry with NaN or infinite coordinates */
  bool is_finite() const;

  static primitive_t make_sphere(
    const Imath::V3f& center
  , float radius
  , uint32_t material);

  static primitive_t make_plane(
    const Imath::V3f& point
  , const Imath::V3f& normal
  , uint32_t material);

  static primitive_t make_triangle(
    const Imath::V3f& a
  , const Imath::V3f& b
  , const Imath::V3f& c
  , uint32_t material);

  static primitive_t make_triangle(
    const Imath::V3f (&v)[3]
  , const Imath::V3f* n
  , const Imath::V2f* uv
  , uint32_t material);
};
