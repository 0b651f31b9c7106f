#pragma once

#include <ImathBox.h>
#include <ImathVec.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace aabb {
  /* boxes thinner than this on any axis get padded, so flat primitives
   * like axis aligned triangles still have a volume to hit */
  static const float PADDING = 0.0001f;

  inline bool is_empty_on(const Imath::Box3f& box, uint32_t axis) {
    return box.max[axis] < box.min[axis];
  }

  inline float area(const Imath::Box3f& box) {
    if (box.isEmpty()) {
      return 0.0f;
    }
    auto d = box.max - box.min;
    return 2.0 * (d.x * d.y + d.x * d.z + d.y * d.z);
  }

  inline uint32_t largest_axis(const Imath::Box3f& box) {
    if (box.isEmpty()) {
      return 0;
    }
    return box.majorAxis();
  }

  inline Imath::Box3f pad(const Imath::Box3f& box) {
    auto out = box;
    for (auto axis=0; axis<3; ++axis) {
      if (out.max[axis] - out.min[axis] < PADDING) {
        out.min[axis] -= PADDING * 0.5f;
        out.max[axis] += PADDING * 0.5f;
      }
    }
    return out;
  }

  inline bool is_finite(const Imath::Box3f& box) {
    for (auto axis=0; axis<3; ++axis) {
      if (!std::isfinite(box.min[axis]) || !std::isfinite(box.max[axis])) {
        return false;
      }
    }
    return true;
  }

  /* slab test against a ray given by its origin, and the reciprocal of
   * its direction. on a hit, 'd' receives the entry distance clamped to
   * [tmin, tmax] */
  inline bool intersect(
    const Imath::Box3f& box
  , const Imath::V3f& o
  , const Imath::V3f& inv
  , float tmin
  , float tmax
  , float& d)
  {
    for (auto axis=0; axis<3; ++axis) {
      const auto t0 = (box.min[axis] - o[axis]) * inv[axis];
      const auto t1 = (box.max[axis] - o[axis]) * inv[axis];

      // 0 * inf yields NaN when a ray parallel to the slab runs exactly
      // in the plane of one of its faces. the closed slab contains the
      // whole ray then, on the min face as well as on the max face
      if (std::isnan(t0) || std::isnan(t1)) {
        continue;
      }

      tmin = std::max(tmin, std::min(t0, t1));
      tmax = std::min(tmax, std::max(t0, t1));

      if (tmax < tmin) {
        return false;
      }
    }

    d = tmin;
    return true;
  }
}
