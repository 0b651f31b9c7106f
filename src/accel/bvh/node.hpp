#pragma once

#include <ImathBox.h>
#include <ImathVec.h>

#include <cstdint>

namespace bvh {
  /* A node of the hierarchy. nodes live in one flat array, and refer to
   * their children by index. a leaf refers to a range of primitive
   * indices, an internal node to its two children */
  struct node_t {
    // bounding volume of everything below this node
    Imath::Box3f bounds;
    // children of an internal node
    uint32_t left, right;
    // offset into the primitive indices, and number of primitives if
    // this is a leaf node
    uint32_t offset;
    uint32_t num;

    inline node_t()
      : left(0), right(0), offset(0), num(0)
    {}

    inline bool is_leaf() const {
      return num > 0;
    }

    inline void set_children(uint32_t l, uint32_t r) {
      left  = l;
      right = r;
      num   = 0;
    }

    inline void set_leaf(uint32_t index, uint32_t count) {
      offset = index;
      num    = count;
    }
  };
}
