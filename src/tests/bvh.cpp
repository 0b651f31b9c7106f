#include "helpers.hpp"

#include "accel/bvh.hpp"
#include "primitive.hpp"
#include "state.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

namespace {
  /* a deterministic soup of spheres, triangles and a floor plane */
  std::vector<primitive_t> random_scene(uint32_t n, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> pos(-10.0f, 10.0f);
    std::uniform_real_distribution<float> size(0.05f, 1.0f);

    std::vector<primitive_t> out;
    for (auto i=0u; i<n; ++i) {
      const Imath::V3f c(pos(gen), pos(gen), pos(gen));
      if (i % 2 == 0) {
        out.push_back(primitive_t::make_sphere(c, size(gen), i));
      }
      else {
        const Imath::V3f a(size(gen), size(gen), size(gen));
        const Imath::V3f b(-size(gen), size(gen), -size(gen));
        out.push_back(primitive_t::make_triangle(c, c + a, c + b, i));
      }
    }

    out.push_back(primitive_t::make_plane(Imath::V3f(0.0f, -12.0f, 0.0f), Imath::V3f(0.0f, 1.0f, 0.0f), n));
    return out;
  }

  std::vector<ray_t> random_rays(uint32_t n, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> pos(-15.0f, 15.0f);
    std::uniform_real_distribution<float> target(-8.0f, 8.0f);

    std::vector<ray_t> out;
    for (auto i=0u; i<n; ++i) {
      const Imath::V3f o(pos(gen), pos(gen), pos(gen));
      const Imath::V3f t(target(gen), target(gen), target(gen));
      out.emplace_back(o, (t - o).normalized());
    }
    return out;
  }

  void expect_matches_brute_force(bvh::policy_t policy) {
    const auto primitives = random_scene(500, 7);
    const auto rays = random_rays(2000, 11);

    accel::bvh_t bvh;
    bvh.build(primitives, policy);

    auto hits = 0;
    for (const auto& ray: rays) {
      float t = 0.0f;
      uint32_t index = 0;
      const auto expected = test::brute_force(primitives, ray, t, index);

      interaction_t hit;
      const auto found = bvh.nearest(ray, hit);

      ASSERT_EQ(found, expected);
      EXPECT_EQ(bvh.any(ray), expected);

      if (found) {
        ++hits;
        EXPECT_FLOAT_EQ(hit.t, t);
        EXPECT_EQ(hit.material, primitives[hit.primitive].material);
      }
    }

    // make sure the test actually exercises the tree
    EXPECT_GT(hits, 100);
  }
}

TEST(BVH, NearestMatchesBruteForceSah) {
  expect_matches_brute_force(bvh::policy_t::Sah);
}

TEST(BVH, NearestMatchesBruteForceMedian) {
  expect_matches_brute_force(bvh::policy_t::Median);
}

TEST(BVH, EmptyScene) {
  std::vector<primitive_t> primitives;

  accel::bvh_t bvh;
  bvh.build(primitives);

  EXPECT_EQ(bvh.num_nodes, 0u);
  EXPECT_TRUE(bvh.bounds().isEmpty());

  const ray_t ray(Imath::V3f(0.0f), Imath::V3f(0.0f, 0.0f, -1.0f));
  interaction_t hit;
  EXPECT_FALSE(bvh.nearest(ray, hit));
  EXPECT_FALSE(bvh.any(ray));
}

TEST(BVH, SinglePrimitiveIsOneLeaf) {
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f), 1.0f, 0)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  ASSERT_EQ(bvh.num_nodes, 1u);
  EXPECT_TRUE(bvh.root->is_leaf());
  EXPECT_EQ(bvh.root->num, 1u);
  EXPECT_EQ(bvh.depth, 0u);
}

TEST(BVH, SphereSeenByCamera) {
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f), 1.0f, 0)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  const Imath::V3f camera(0.0f, 0.0f, 5.0f);
  const ray_t ray(camera, (Imath::V3f(0.0f) - camera).normalized());

  interaction_t hit;
  ASSERT_TRUE(bvh.nearest(ray, hit));

  EXPECT_FLOAT_EQ(hit.t, 5.0f - 1.0f);
  EXPECT_TRUE(hit.front_face);
  EXPECT_EQ(hit.material, 0u);
  EXPECT_NEAR(hit.n.z, 1.0f, 1e-6f);
  EXPECT_GT(hit.n.dot(camera - hit.p), 0.0f);
}

TEST(BVH, BuildIsDeterministic) {
  const auto primitives = random_scene(300, 3);

  accel::bvh_t a, b;
  a.build(primitives);
  b.build(primitives);

  ASSERT_EQ(a.num_nodes, b.num_nodes);
  EXPECT_EQ(a.depth, b.depth);

  for (auto i=0u; i<a.num_nodes; ++i) {
    const auto& na = a.root[i];
    const auto& nb = b.root[i];

    EXPECT_EQ(na.is_leaf(), nb.is_leaf());
    EXPECT_EQ(na.bounds.min, nb.bounds.min);
    EXPECT_EQ(na.bounds.max, nb.bounds.max);
    if (na.is_leaf()) {
      EXPECT_EQ(na.offset, nb.offset);
      EXPECT_EQ(na.num, nb.num);
    }
    else {
      EXPECT_EQ(na.left, nb.left);
      EXPECT_EQ(na.right, nb.right);
    }
  }
}

TEST(BVH, InternalBoundsEncloseChildren) {
  const auto primitives = random_scene(400, 5);

  accel::bvh_t bvh;
  bvh.build(primitives);

  for (auto i=0u; i<bvh.num_nodes; ++i) {
    const auto& node = bvh.root[i];
    if (node.is_leaf()) {
      continue;
    }

    for (const auto child: { node.left, node.right }) {
      const auto& bounds = bvh.root[child].bounds;
      for (auto axis=0; axis<3; ++axis) {
        EXPECT_LE(node.bounds.min[axis], bounds.min[axis]);
        EXPECT_GE(node.bounds.max[axis], bounds.max[axis]);
      }
    }
  }

  EXPECT_LT(bvh.depth, bvh::MAX_DEPTH);
}

TEST(BVH, CoincidentPrimitivesStillSplit) {
  std::vector<primitive_t> primitives;
  for (auto i=0u; i<100; ++i) {
    primitives.push_back(primitive_t::make_sphere(Imath::V3f(1.0f, 2.0f, 3.0f), 0.5f, i));
  }

  accel::bvh_t bvh;
  bvh.build(primitives);

  for (auto i=0u; i<bvh.num_nodes; ++i) {
    if (bvh.root[i].is_leaf()) {
      EXPECT_LE(bvh.root[i].num, bvh::MAX_PRIMS_IN_NODE);
    }
  }

  const ray_t ray(Imath::V3f(1.0f, 2.0f, 10.0f), Imath::V3f(0.0f, 0.0f, -1.0f));
  interaction_t hit;
  ASSERT_TRUE(bvh.nearest(ray, hit));
  EXPECT_FLOAT_EQ(hit.t, 6.5f);
}

TEST(BVH, EqualDistanceKeepsFirstFound) {
  // two identical spheres, the hit is the same for both
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f), 1.0f, 0)
  , primitive_t::make_sphere(Imath::V3f(0.0f), 1.0f, 1)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  const ray_t ray(Imath::V3f(0.0f, 0.0f, 5.0f), Imath::V3f(0.0f, 0.0f, -1.0f));

  interaction_t first;
  ASSERT_TRUE(bvh.nearest(ray, first));
  EXPECT_EQ(first.primitive, 0u);

  for (auto i=0; i<10; ++i) {
    interaction_t again;
    ASSERT_TRUE(bvh.nearest(ray, again));
    EXPECT_EQ(again.primitive, first.primitive);
  }
}

TEST(BVH, PlanesAreHitOutsideTheTree) {
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f, 0.0f, -5.0f), 1.0f, 0)
  , primitive_t::make_plane(Imath::V3f(0.0f, -1.0f, 0.0f), Imath::V3f(0.0f, 1.0f, 0.0f), 1)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  // far away from the box of the sphere
  const ray_t ray(Imath::V3f(100.0f, 10.0f, 100.0f), Imath::V3f(0.0f, -1.0f, 0.0f));

  interaction_t hit;
  ASSERT_TRUE(bvh.nearest(ray, hit));
  EXPECT_EQ(hit.primitive, 1u);
  EXPECT_FLOAT_EQ(hit.t, 11.0f);
  EXPECT_TRUE(bvh.any(ray));
}

TEST(BVH, AnyHitRespectsMaxDistance) {
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f, 0.0f, -5.0f), 1.0f, 0)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  const Imath::V3f o(0.0f);
  const Imath::V3f d(0.0f, 0.0f, -1.0f);

  EXPECT_TRUE(bvh.any(ray_t(o, d, 0.0f, 10.0f)));
  EXPECT_FALSE(bvh.any(ray_t(o, d, 0.0f, 3.0f)));
}

TEST(BVH, InvalidRaysMiss) {
  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(0.0f), 1.0f, 0)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  const auto nan = std::numeric_limits<float>::quiet_NaN();

  interaction_t hit;
  EXPECT_FALSE(bvh.nearest(ray_t(Imath::V3f(0.0f, 0.0f, 5.0f), Imath::V3f(0.0f)), hit));
  EXPECT_FALSE(bvh.nearest(ray_t(Imath::V3f(0.0f, 0.0f, 5.0f), Imath::V3f(nan, 0.0f, -1.0f)), hit));
  EXPECT_FALSE(bvh.any(ray_t(Imath::V3f(nan), Imath::V3f(0.0f, 0.0f, -1.0f))));
}

TEST(BVH, NonFiniteGeometryIsRejected) {
  const auto inf = std::numeric_limits<float>::infinity();

  std::vector<primitive_t> primitives = {
    primitive_t::make_sphere(Imath::V3f(inf, 0.0f, 0.0f), 1.0f, 0)
  };

  accel::bvh_t bvh;
  EXPECT_THROW(bvh.build(primitives), std::runtime_error);
}

TEST(BVH, AxisAlignedRaysThroughFlatBoxes) {
  // a triangle in the z=0 plane, hit by a ray along the z axis, and one
  // travelling in the plane of the triangle
  std::vector<primitive_t> primitives = {
    primitive_t::make_triangle(
      Imath::V3f(-1.0f, -1.0f, 0.0f)
    , Imath::V3f( 1.0f, -1.0f, 0.0f)
    , Imath::V3f( 0.0f,  1.0f, 0.0f)
    , 0)
  };

  accel::bvh_t bvh;
  bvh.build(primitives);

  interaction_t hit;
  ASSERT_TRUE(bvh.nearest(ray_t(Imath::V3f(0.0f, 0.0f, 2.0f), Imath::V3f(0.0f, 0.0f, -1.0f)), hit));
  EXPECT_FLOAT_EQ(hit.t, 2.0f);

  EXPECT_FALSE(bvh.nearest(ray_t(Imath::V3f(-5.0f, 0.0f, 0.0f), Imath::V3f(1.0f, 0.0f, 0.0f)), hit));
}
