#include "spt.hpp"
#include "material.hpp"

#include <algorithm>
#include <cmath>

namespace spt {
  Imath::Color3f integrator_t::direct(
    const interaction_t& hit
  , const Imath::Color3f& albedo) const
  {
    Imath::Color3f out(0.0f);

    for (const auto& light: scene.lights) {
      ray_t shadow;
      Imath::Color3f irradiance;

      if (!light.setup_shadow_ray(hit, shadow, irradiance)) {
        continue;
      }

      if (!accel.any(shadow)) {
        out += albedo * irradiance * float(M_1_PI);
      }
    }

    return out;
  }

  Imath::Color3f integrator_t::operator()(ray_t ray, sampler_t& sampler) const {
    Imath::Color3f r(0.0f);
    Imath::Color3f beta(1.0f);

    for (auto depth=0u; depth<max_depth; ++depth) {
      // invalid rays don't contribute anything
      if (!ray.is_valid()) {
        break;
      }

      interaction_t hit;
      if (!accel.nearest(ray, hit)) {
        r += beta * scene.background(ray.wi);
        break;
      }

      const auto& material = scene.materials[hit.material];

      r += beta * material.emitted();

      if (!scene.lights.empty() && material.type() == material_t::type_t::Lambertian) {
        r += beta * direct(hit, material.diffuse(hit, scene.textures));
      }

      scattered_t scattered;
      if (!material.scatter(ray, hit, sampler, scene.textures, scattered)) {
        break;
      }

      beta *= scattered.attenuation;
      if (color::is_black(beta)) {
        break;
      }

      if (roulette_depth > 0 && depth + 1 >= roulette_depth) {
        const auto q = std::clamp(1.0f - color::max(beta), 0.0f, MAX_ROULETTE_PROBABILITY);
        if (sampler.sample() < q) {
          break;
        }
        beta /= 1.0f - q;
      }

      ray = scattered.ray;
    }

    return r;
  }
}
