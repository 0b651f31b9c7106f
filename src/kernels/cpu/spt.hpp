#pragma once

#include "sampling.hpp"
#include "scene.hpp"
#include "state.hpp"
#include "accel/bvh.hpp"
#include "utils/color.hpp"

#include <cstdint>

/**
 * Path tracing integrator
 *
 * Follows a single path from the camera through the scene, one bounce
 * at a time. At every diffuse vertex the point lights are sampled
 * directly with a shadow ray. Paths end when they leave the scene, get
 * absorbed, reach the maximum depth, or are terminated by russian
 * roulette
 */
namespace spt {
  // paths are never killed with a higher probability than this
  static const float MAX_ROULETTE_PROBABILITY = 0.95f;

  struct integrator_t {
    const scene_t&      scene;
    const accel::bvh_t& accel;

    uint32_t max_depth;
    // 0 disables russian roulette
    uint32_t roulette_depth;

    inline integrator_t(
      const scene_t& scene
    , const accel::bvh_t& accel
    , uint32_t max_depth
    , uint32_t roulette_depth)
      : scene(scene)
      , accel(accel)
      , max_depth(max_depth)
      , roulette_depth(roulette_depth)
    {}

    /* estimate the radiance arriving along a camera ray */
    Imath::Color3f operator()(ray_t ray, sampler_t& sampler) const;

    /* radiance from the point lights, reflected at a diffuse hit */
    Imath::Color3f direct(const interaction_t& hit, const Imath::Color3f& albedo) const;
  };
}
