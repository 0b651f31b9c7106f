#pragma once

#include "primitive.hpp"
#include "state.hpp"
#include "math/orthogonal_base.hpp"
#include "math/vector.hpp"

#include <cmath>

namespace accel {
  /* Ray / primitive intersection routines. Each test only computes the
   * distance to the hit (and barycentrics for triangles), the full
   * surface description is filled in by surface(), once the closest hit
   * is known. Degenerate primitives are plain misses */
  namespace intersect {
    static const float PARALLEL_EPSILON = 1e-6f;
    static const float DET_EPSILON      = 0.00000001f;

    inline bool sphere(
      const sphere_t& s
    , const ray_t& ray
    , float tmax
    , float& t)
    {
      if (!(s.radius > 0.0f)) {
        return false;
      }

      const auto oc = ray.p - s.center;
      const auto a  = ray.wi.length2();
      const auto hb = oc.dot(ray.wi);
      const auto c  = oc.length2() - s.radius * s.radius;

      const auto discriminant = hb * hb - a * c;
      if (discriminant < 0.0f) {
        return false;
      }

      const auto sq = std::sqrt(discriminant);

      // the near root first, the far root is only a hit from the inside
      auto root = (-hb - sq) / a;
      if (root < ray.tmin || root > tmax) {
        root = (-hb + sq) / a;
        if (root < ray.tmin || root > tmax) {
          return false;
        }
      }

      t = root;
      return true;
    }

    inline bool plane(
      const plane_t& p
    , const ray_t& ray
    , float tmax
    , float& t)
    {
      const auto denominator = p.normal.dot(ray.wi);

      // rays (almost) parallel to the plane never hit it
      if (std::fabs(denominator) < PARALLEL_EPSILON) {
        return false;
      }

      const auto d = (p.point - ray.p).dot(p.normal) / denominator;
      if (!(d >= ray.tmin && d <= tmax)) {
        return false;
      }

      t = d;
      return true;
    }

    /* Moeller-Trumbore ray triangle intersection. on a hit 'uv' receives
     * the barycentric weights of the second and third vertex */
    inline bool triangle(
      const triangle_t& tri
    , const ray_t& ray
    , float tmax
    , float& t
    , Imath::V2f& uv)
    {
      const auto e0 = tri.v[1] - tri.v[0];
      const auto e1 = tri.v[2] - tri.v[0];
      const auto p  = ray.wi.cross(e1);

      const auto det = e0.dot(p);

      // zero area triangles, and rays in the plane of the triangle
      if (std::fabs(det) < DET_EPSILON) {
        return false;
      }

      const auto ood = 1.0f / det;
      const auto tv  = ray.p - tri.v[0];

      const auto u = tv.dot(p) * ood;
      if (u < 0.0f || u > 1.0f) {
        return false;
      }

      const auto q = tv.cross(e0);

      const auto v = ray.wi.dot(q) * ood;
      if (v < 0.0f || (u + v) > 1.0f) {
        return false;
      }

      const auto d = e1.dot(q) * ood;
      if (!(d >= ray.tmin && d <= tmax)) {
        return false;
      }

      t  = d;
      uv = Imath::V2f(u, v);
      return true;
    }

    /* dispatch on the primitive type */
    inline bool primitive(
      const primitive_t& prim
    , const ray_t& ray
    , float tmax
    , float& t
    , Imath::V2f& uv)
    {
      switch (prim.type()) {
      case primitive_t::type_t::Sphere:
        return sphere(prim.sphere(), ray, tmax, t);
      case primitive_t::type_t::Plane:
        return plane(prim.plane(), ray, tmax, t);
      case primitive_t::type_t::Triangle:
        return triangle(prim.triangle(), ray, tmax, t, uv);
      }
      return false;
    }

    /* texture coordinates on a sphere, from the outward normal */
    inline Imath::V2f sphere_uv(const Imath::V3f& n) {
      const auto theta = std::acos(std::fmin(std::fmax(-n.y, -1.0f), 1.0f));
      const auto phi   = std::atan2(-n.z, n.x) + float(M_PI);
      return Imath::V2f(phi * float(0.5 * M_1_PI), theta * float(M_1_PI));
    }

    /* fill in the hit record for a hit at distance t */
    inline void surface(
      const primitive_t& prim
    , uint32_t index
    , const ray_t& ray
    , float t
    , const Imath::V2f& uv
    , interaction_t& hit)
    {
      hit.t         = t;
      hit.p         = ray.at(t);
      hit.material  = prim.material;
      hit.primitive = index;

      switch (prim.type()) {
      case primitive_t::type_t::Sphere: {
        const auto& s = prim.sphere();
        const auto n = (hit.p - s.center) / s.radius;
        hit.st = sphere_uv(n);
        hit.barycentrics = Imath::V3f(0.0f);
        hit.set_face_normal(ray, n, n);
        break;
      }
      case primitive_t::type_t::Plane: {
        const auto& p = prim.plane();
        const orthogonal_base_t base(p.normal);
        const auto local = base.to_local(hit.p - p.point);
        hit.st = Imath::V2f(local.x, local.z);
        hit.barycentrics = Imath::V3f(0.0f);
        hit.set_face_normal(ray, p.normal, p.normal);
        break;
      }
      case primitive_t::type_t::Triangle: {
        const auto& tri = prim.triangle();
        const auto w = 1.0f - uv.x - uv.y;

        hit.barycentrics = Imath::V3f(w, uv.x, uv.y);

        const auto ng = tri.face_normal().normalized();

        auto n = ng;
        if (tri.has_normals) {
          const auto interpolated = tri.n[0] * w + tri.n[1] * uv.x + tri.n[2] * uv.y;
          if (!near_zero(interpolated)) {
            n = interpolated.normalized();
          }
        }

        if (tri.has_uvs) {
          hit.st = tri.uv[0] * w + tri.uv[1] * uv.x + tri.uv[2] * uv.y;
        }
        else {
          hit.st = uv;
        }

        hit.set_face_normal(ray, ng, n);
        break;
      }
      }
    }
  }
}
