#include "sampling.hpp"
#include "scene.hpp"
#include "accel/bvh.hpp"
#include "kernels/cpu/spt.hpp"

#include <gtest/gtest.h>

namespace {
  /* a diffuse floor under a white sky. a ray straight down hits the
   * floor once, and every bounce off it escapes to the sky, so the
   * exact radiance is the albedo of the floor */
  struct floor_scene_t {
    scene_t scene;
    accel::bvh_t bvh;

    floor_scene_t(float albedo) {
      scene.background.top    = Imath::Color3f(1.0f);
      scene.background.bottom = Imath::Color3f(1.0f);

      const auto material = scene.add("floor", material_t::make_lambertian(Imath::Color3f(albedo)));
      scene.add(primitive_t::make_plane(Imath::V3f(0.0f), Imath::V3f(0.0f, 1.0f, 0.0f), material));

      bvh.build(scene.primitives);
    }
  };

  const ray_t DOWN(Imath::V3f(0.0f, 1.0f, 0.0f), Imath::V3f(0.0f, -1.0f, 0.0f));
}

TEST(Integrator, SingleBounce) {
  floor_scene_t world(0.5f);
  const spt::integrator_t integrate(world.scene, world.bvh, 9, 0);

  for (auto i=0u; i<100; ++i) {
    sampler_t sampler(7, 0, 0, i);
    const auto r = integrate(DOWN, sampler);
    EXPECT_NEAR(r.x, 0.5f, 1e-6f);
    EXPECT_NEAR(r.y, 0.5f, 1e-6f);
    EXPECT_NEAR(r.z, 0.5f, 1e-6f);
  }
}

TEST(Integrator, DepthLimit) {
  floor_scene_t world(0.5f);

  // the path ends at the floor, before it gets to see the sky
  const spt::integrator_t integrate(world.scene, world.bvh, 1, 0);

  sampler_t sampler(7, 0, 0, 0);
  EXPECT_EQ(integrate(DOWN, sampler), Imath::Color3f(0.0f));
}

TEST(Integrator, RouletteIsUnbiased) {
  floor_scene_t world(0.5f);
  const spt::integrator_t integrate(world.scene, world.bvh, 9, 1);

  const auto n = 20000u;
  auto terminated = 0u;
  auto sum = 0.0f;

  for (auto i=0u; i<n; ++i) {
    sampler_t sampler(11, 3, 4, i);
    const auto r = integrate(DOWN, sampler);

    // a surviving path carries the compensated weight of all others
    if (r.x == 0.0f) {
      ++terminated;
    }
    else {
      EXPECT_NEAR(r.x, 1.0f, 1e-5f);
    }
    sum += r.x;
  }

  EXPECT_GT(terminated, 0u);
  EXPECT_LT(terminated, n);
  EXPECT_NEAR(sum / n, 0.5f, 0.02f);
}

TEST(Integrator, RouletteSparesFullThroughput) {
  floor_scene_t world(1.0f);
  const spt::integrator_t integrate(world.scene, world.bvh, 9, 1);

  for (auto i=0u; i<1000; ++i) {
    sampler_t sampler(11, 3, 4, i);
    const auto r = integrate(DOWN, sampler);
    EXPECT_NEAR(r.x, 1.0f, 1e-5f);
  }
}
