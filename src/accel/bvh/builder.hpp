#pragma once

#include "node.hpp"
#include "math/aabb.hpp"

#include <ImathBox.h>
#include <ImathVec.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace bvh {
  // primitive count at, or below which a node becomes a leaf
  static const uint32_t MAX_PRIMS_IN_NODE = 4;
  // hard limit on the depth of the tree, traversal stacks are sized by it
  static const uint32_t MAX_DEPTH = 64;

  /* how a set of primitives gets divided among two children */
  enum class policy_t {
    Median, // object median along the axis of greatest extent
    Sah     // binned surface area heuristic along that axis
  };

  struct reference_t {
    uint32_t     index;    // an index into the real scene geometry
    Imath::Box3f bounds;   // the bounding box of the primitive
    Imath::V3f   centroid; // the center of the bounding box

    inline reference_t()
      : index(0)
    {}

    inline reference_t(uint32_t index, const Imath::Box3f& bounds)
      : index(index), bounds(bounds), centroid(bounds.center())
    {}
  };

  /**
   * Build information about a subset of the primitives in the scene
   */
  struct geometry_t {
    // information relevant for the build, about the primitives in the scene
    std::vector<reference_t>* references;
    // indices into the references vector
    uint32_t start, end;
    // the bounding volume for this subset of the primitives in the scene
    Imath::Box3f bounds;
    Imath::Box3f centroid_bounds;

    inline geometry_t(
        std::vector<reference_t>& references
      , uint32_t start
      , uint32_t end)
      : references(&references), start(start), end(end)
    {
      for (auto i=start; i<end; ++i) {
        bounds.extendBy(references[i].bounds);
        centroid_bounds.extendBy(references[i].centroid);
      }
    }

    inline uint32_t count() const {
      return end - start;
    }

    inline const reference_t& reference(uint32_t i) const {
      return (*references)[start+i];
    }

    inline reference_t* begin() const {
      return references->data() + start;
    }

    inline reference_t* end_ptr() const {
      return references->data() + end;
    }

    template<typename F>
    inline uint32_t partition(const F& f) const {
      // stable, so the build only depends on the input order
      const auto p = std::stable_partition(begin(), end_ptr(), f);
      return (uint32_t) (p - references->data());
    }

    /* split at the object median along an axis. ties are broken by the
     * primitive index, so the result doesn't depend on the sort
     * implementation */
    inline uint32_t median(uint32_t axis) const {
      const auto mid = start + count() / 2;
      std::nth_element(begin(), references->data() + mid, end_ptr(),
        [axis](const reference_t& a, const reference_t& b) {
          if (a.centroid[axis] != b.centroid[axis]) {
            return a.centroid[axis] < b.centroid[axis];
          }
          return a.index < b.index;
        });
      return mid;
    }
  };

  /**
   * Builds the flat node array of a hierarchy over a set of primitive
   * bounds. The build is deterministic for a fixed input order and policy
   */
  struct builder_t {
    std::vector<node_t>&   nodes;
    std::vector<uint32_t>& indices;

    policy_t policy;
    uint32_t depth;

    builder_t(
      std::vector<node_t>& nodes
    , std::vector<uint32_t>& indices
    , policy_t policy);

    /* build the tree over all references. an empty set yields an empty
     * tree, anything else a root node at index 0 */
    void build(std::vector<reference_t>& references);

    uint32_t make_node();

    uint32_t make_leaf(uint32_t node, const geometry_t& geometry);

    uint32_t recurse(const geometry_t& geometry, uint32_t level);

    /* find the split point for a set of primitives. both sides of the
     * split are never empty */
    uint32_t split(const geometry_t& geometry) const;
  };
}
