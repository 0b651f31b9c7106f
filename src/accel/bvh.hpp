#pragma once

#include "bvh/node.hpp"
#include "bvh/builder.hpp"
#include "primitive.hpp"
#include "state.hpp"
#include "utils/nocopy.hpp"

#include <ImathBox.h>

#include <cstdint>
#include <vector>

namespace accel {
  /* A binary bounding volume hierarchy over the bounded primitives of a
   * scene. Unbounded primitives (planes) can't be put into boxes, so they
   * are kept in a separate list, and tested against every ray. The
   * hierarchy is immutable after the build, and can be queried from any
   * number of threads concurrently */
  struct bvh_t : nocopy_t {
    struct details_t;

    details_t* details;

    // pointer to the beginning of the node array, the root is the first
    // node if the tree isn't empty
    const bvh::node_t* root;
    // the number of nodes in the tree
    uint32_t num_nodes;
    // depth of the deepest leaf, the root has depth 0
    uint32_t depth;

    bvh_t();
    ~bvh_t();

    /** clear all data from the bvh */
    void reset();

    /* build the hierarchy over a set of primitives. the primitives are
     * referenced, not copied, and must outlive the hierarchy. throws if
     * a primitive has non finite coordinates */
    void build(
      const std::vector<primitive_t>& primitives
    , bvh::policy_t policy = bvh::policy_t::Sah);

    /* find the closest hit along a ray within [tmin, tmax]. on equal
     * distances the primitive found first during traversal wins */
    bool nearest(const ray_t& ray, interaction_t& hit) const;

    /* find any hit along a ray within [tmin, tmax], for shadow rays */
    bool any(const ray_t& ray) const;

    // the bounds of the bounded primitives in this accelerator
    Imath::Box3f bounds() const;
  };
}
