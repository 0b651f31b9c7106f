#pragma once

#include "builder.hpp"
#include "math/aabb.hpp"

#include <ImathBox.h>
#include <ImathVec.h>

#include <algorithm>
#include <limits>

namespace bvh {
  namespace sah {
    static const uint32_t NUM_SPLIT_BINS = 12;
    static const float    TRAVERSAL_COST = 1.0f;

    struct split_t {
      uint32_t axis;
      uint32_t bin;
      float    cost;

      inline split_t(uint32_t axis, uint32_t bin, float cost)
        : axis(axis), bin(bin), cost(cost)
      {}

      inline bool is_valid() const {
        return cost < std::numeric_limits<float>::max();
      }
    };

    struct bin_t {
      uint32_t     count;
      Imath::Box3f bounds;

      inline bin_t()
        : count(0)
      {}

      inline void add(const reference_t& p) {
        bounds.extendBy(p.bounds);
        count++;
      }
    };

    template<int N>
    struct bins_t {
      bin_t bins[N];

      inline const bin_t& operator[](uint32_t i) const {
        return bins[i];
      }

      inline void add(const Imath::Box3f& bounds, const reference_t& p, uint32_t axis) {
        bins[find(bounds, p, axis)].add(p);
      }

      static inline Imath::V3f offset(const Imath::Box3f& l, const Imath::V3f& r) {
        auto o = r - l.min;
        if (l.max.x > l.min.x) { o.x /= (l.max.x - l.min.x); }
        if (l.max.y > l.min.y) { o.y /= (l.max.y - l.min.y); }
        if (l.max.z > l.min.z) { o.z /= (l.max.z - l.min.z); }
        return o;
      }

      static inline uint32_t find(const Imath::Box3f& bounds, const reference_t& p, uint32_t axis) {
        auto off = offset(bounds, p.centroid)[axis];
        return std::clamp((int) (N * off), 0, N-1);
      }
    };

    /* evaluate the bin boundaries along one axis, and return the
     * cheapest one */
    inline split_t find(const geometry_t& geometry, uint32_t axis) {
      if (aabb::is_empty_on(geometry.centroid_bounds, axis)
       || geometry.centroid_bounds.max[axis] == geometry.centroid_bounds.min[axis]) {
        return split_t(axis, 0, std::numeric_limits<float>::max());
      }

      bins_t<NUM_SPLIT_BINS> bins;
      for (auto i=0u; i<geometry.count(); ++i) {
        bins.add(geometry.centroid_bounds, geometry.reference(i), axis);
      }

      const auto parent_area = aabb::area(geometry.bounds);

      auto split_cost = std::numeric_limits<float>::max();
      auto split_bin  = 0u;

      for (auto i=0u; i<NUM_SPLIT_BINS-1; ++i) {
        Imath::Box3f a, b;
        auto left = 0u; auto right = 0u;
        for (auto j=0u; j<=i; ++j) {
          a.extendBy(bins[j].bounds);
          left += bins[j].count;
        }

        for (auto j=i+1; j<NUM_SPLIT_BINS; ++j) {
          b.extendBy(bins[j].bounds);
          right += bins[j].count;
        }

        if (left == 0 || right == 0) {
          continue;
        }

        auto cost = TRAVERSAL_COST;
        if (parent_area > 0.0f) {
          cost += (left * aabb::area(a) + right * aabb::area(b)) / parent_area;
        }
        else {
          cost += 0.5f * (left + right);
        }

        if (cost < split_cost) {
          split_cost = cost;
          split_bin = i;
        }
      }

      return split_t(axis, split_bin, split_cost);
    }

    /* partition the primitives of 'geometry' along a split, returns the
     * index of the first primitive on the right side */
    inline uint32_t apply(const split_t& split, const geometry_t& geometry) {
      const auto bounds = geometry.centroid_bounds;
      return geometry.partition([&](const reference_t& p) {
        return bins_t<NUM_SPLIT_BINS>::find(bounds, p, split.axis) <= split.bin;
      });
    }
  }
}
