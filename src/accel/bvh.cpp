#include "bvh.hpp"
#include "bvh/binned_sah_builder.hpp"
#include "intersect.hpp"

#include <stdexcept>
#include <string>

namespace bvh {
  builder_t::builder_t(
    std::vector<node_t>& nodes
  , std::vector<uint32_t>& indices
  , policy_t policy)
    : nodes(nodes)
    , indices(indices)
    , policy(policy)
    , depth(0)
  {}

  void builder_t::build(std::vector<reference_t>& references) {
    depth = 0;

    if (references.empty()) {
      return;
    }

    nodes.reserve(2 * references.size());
    indices.reserve(references.size());

    geometry_t root(references, 0, references.size());
    recurse(root, 0);
  }

  uint32_t builder_t::make_node() {
    nodes.emplace_back();
    return nodes.size() - 1;
  }

  uint32_t builder_t::make_leaf(uint32_t node, const geometry_t& geometry) {
    const auto offset = indices.size();
    for (auto i=0u; i<geometry.count(); ++i) {
      indices.push_back(geometry.reference(i).index);
    }
    nodes[node].set_leaf(offset, geometry.count());
    return node;
  }

  uint32_t builder_t::split(const geometry_t& geometry) const {
    const auto axis = aabb::largest_axis(geometry.centroid_bounds);

    if (policy == policy_t::Sah) {
      const auto s = sah::find(geometry, axis);
      if (s.is_valid()) {
        const auto mid = sah::apply(s, geometry);
        if (mid > geometry.start && mid < geometry.end) {
          return mid;
        }
      }
    }

    // the object median always divides a set into two non empty halves,
    // also when all centroids coincide
    return geometry.median(axis);
  }

  uint32_t builder_t::recurse(const geometry_t& geometry, uint32_t level) {
    const auto node = make_node();
    nodes[node].bounds = geometry.bounds;

    depth = std::max(depth, level);

    if (geometry.count() <= MAX_PRIMS_IN_NODE || level + 1 >= MAX_DEPTH) {
      return make_leaf(node, geometry);
    }

    const auto mid = split(geometry);

    geometry_t l(*geometry.references, geometry.start, mid);
    geometry_t r(*geometry.references, mid, geometry.end);

    // the node array may grow while building the children, so the
    // parent is only accessed by index
    const auto left  = recurse(l, level + 1);
    const auto right = recurse(r, level + 1);

    nodes[node].set_children(left, right);
    return node;
  }
}

namespace accel {
  struct bvh_t::details_t {
    std::vector<bvh::node_t> nodes;
    // primitive indices, referenced by the leaves
    std::vector<uint32_t> indices;
    // primitives without bounds, tested against every ray
    std::vector<uint32_t> unbounded;

    const std::vector<primitive_t>* primitives;

    details_t()
      : primitives(nullptr)
    {}
  };

  namespace {
    struct entry_t {
      uint32_t node;
      float    d;
    };

    inline Imath::V3f reciprocal(const Imath::V3f& d) {
      return Imath::V3f(1.0f / d.x, 1.0f / d.y, 1.0f / d.z);
    }

    /* walks the tree front to back, and calls f for every primitive in
     * the leaves whose box is hit closer than the current tmax. f returns
     * true to stop the traversal */
    template<typename F>
    inline void traverse(
      const bvh::node_t* nodes
    , const uint32_t* indices
    , const ray_t& ray
    , float& tmax
    , const F& f)
    {
      const auto inv = reciprocal(ray.wi);

      // each level pushes at most one far child, so the stack is bound
      // by the depth limit of the builder
      entry_t stack[2 * bvh::MAX_DEPTH];
      auto top = 0;

      float d;
      if (!aabb::intersect(nodes[0].bounds, ray.p, inv, ray.tmin, tmax, d)) {
        return;
      }

      stack[top++] = { 0, d };

      while (top > 0) {
        const auto entry = stack[--top];
        if (entry.d > tmax) {
          continue;
        }

        const auto& node = nodes[entry.node];
        if (node.is_leaf()) {
          for (auto i=0u; i<node.num; ++i) {
            if (f(indices[node.offset + i])) {
              return;
            }
          }
          continue;
        }

        float dl, dr;
        const auto hl = aabb::intersect(nodes[node.left].bounds, ray.p, inv, ray.tmin, tmax, dl);
        const auto hr = aabb::intersect(nodes[node.right].bounds, ray.p, inv, ray.tmin, tmax, dr);

        if (hl && hr) {
          // push the farther child first, so the closer one gets visited
          // next. on equal entry distances the left child goes first
          if (dr < dl) {
            stack[top++] = { node.left, dl };
            stack[top++] = { node.right, dr };
          }
          else {
            stack[top++] = { node.right, dr };
            stack[top++] = { node.left, dl };
          }
        }
        else if (hl) {
          stack[top++] = { node.left, dl };
        }
        else if (hr) {
          stack[top++] = { node.right, dr };
        }
      }
    }
  }

  bvh_t::bvh_t()
    : details(new details_t())
    , root(nullptr)
    , num_nodes(0)
    , depth(0)
  {}

  bvh_t::~bvh_t() {
    delete details;
  }

  void bvh_t::reset() {
    details->nodes.clear();
    details->indices.clear();
    details->unbounded.clear();
    details->primitives = nullptr;

    root = nullptr;
    num_nodes = 0;
    depth = 0;
  }

  void bvh_t::build(
    const std::vector<primitive_t>& primitives
  , bvh::policy_t policy)
  {
    reset();

    details->primitives = &primitives;

    std::vector<bvh::reference_t> references;
    references.reserve(primitives.size());

    for (auto i=0u; i<primitives.size(); ++i) {
      const auto& p = primitives[i];
      if (!p.is_finite()) {
        throw std::runtime_error(
          "primitive " + std::to_string(i) + " has non finite coordinates");
      }

      if (p.is_bounded()) {
        references.emplace_back(i, p.bounds());
      }
      else {
        details->unbounded.push_back(i);
      }
    }

    bvh::builder_t builder(details->nodes, details->indices, policy);
    builder.build(references);

    root      = details->nodes.empty() ? nullptr : details->nodes.data();
    num_nodes = details->nodes.size();
    depth     = builder.depth;
  }

  bool bvh_t::nearest(const ray_t& ray, interaction_t& hit) const {
    if (!details->primitives || !ray.is_valid()) {
      return false;
    }

    const auto& primitives = *details->primitives;

    auto tmax  = ray.tmax;
    auto found = false;
    auto index = 0u;
    Imath::V2f uv(0.0f);

    auto test = [&](uint32_t i) {
      float t;
      Imath::V2f b;
      // strictly closer only, so the first of two equally distant hits
      // is kept
      if (accel::intersect::primitive(primitives[i], ray, tmax, t, b) && t < tmax) {
        tmax  = t;
        index = i;
        uv    = b;
        found = true;
      }
      return false;
    };

    for (auto i: details->unbounded) {
      test(i);
    }

    if (root) {
      traverse(root, details->indices.data(), ray, tmax, test);
    }

    if (found) {
      accel::intersect::surface(primitives[index], index, ray, tmax, uv, hit);
    }

    return found;
  }

  bool bvh_t::any(const ray_t& ray) const {
    if (!details->primitives || !ray.is_valid()) {
      return false;
    }

    const auto& primitives = *details->primitives;

    auto tmax = ray.tmax;
    auto found = false;

    auto test = [&](uint32_t i) {
      float t;
      Imath::V2f b;
      if (accel::intersect::primitive(primitives[i], ray, tmax, t, b)) {
        found = true;
      }
      return found;
    };

    for (auto i: details->unbounded) {
      if (test(i)) {
        return true;
      }
    }

    if (root) {
      traverse(root, details->indices.data(), ray, tmax, test);
    }

    return found;
  }

  Imath::Box3f bvh_t::bounds() const {
    if (root) {
      return root->bounds;
    }
    return Imath::Box3f();
  }
}
