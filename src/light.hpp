#pragma once

#include "state.hpp"
#include "utils/color.hpp"

#include <ImathVec.h>

/* A point light source, sampled with a shadow ray from every diffuse
 * surface a path hits */
struct light_t {
  Imath::V3f     position;
  Imath::Color3f intensity;

  /* compute the shadow ray from a surface point towards the light, and
   * the irradiance the light contributes at that point if it isn't
   * occluded. returns false if the light is behind the surface */
  bool setup_shadow_ray(
    const interaction_t& hit
  , ray_t& ray
  , Imath::Color3f& irradiance) const;

  /* constructs a point light source */
  static light_t make_point(const Imath::V3f& position, const Imath::Color3f& intensity);
};
