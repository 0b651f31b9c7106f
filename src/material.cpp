#include "material.hpp"
#include "sampling.hpp"
#include "texture.hpp"
#include "math/fresnel.hpp"
#include "math/orthogonal_base.hpp"
#include "math/sampling.hpp"
#include "math/vector.hpp"

#include <algorithm>
#include <cmath>

namespace {
  inline Imath::Color3f albedo(
    const lambertian_t& m
  , const interaction_t& hit
  , const std::vector<texture_t>& textures)
  {
    if (m.is_textured()) {
      return textures[m.texture].sample(hit.st);
    }
    return m.albedo;
  }

  bool scatter_lambertian(
    const lambertian_t& m
  , const interaction_t& hit
  , sampler_t& sampler
  , const std::vector<texture_t>& textures
  , scattered_t& out)
  {
    const auto local = sample::hemisphere::cosine_weighted(sampler.sample2());

    auto wo = orthogonal_base_t(hit.n).to_world(local);
    // samples right at the horizon may end up below the surface after
    // the change of basis
    if (near_zero(wo) || wo.dot(hit.ng) <= 0.0f) {
      wo = hit.n;
    }

    out.ray = ray_t(offset(hit.p, hit.ng), wo.normalized());
    out.attenuation = albedo(m, hit, textures);
    return true;
  }

  bool scatter_metal(
    const metal_t& m
  , const ray_t& ray
  , const interaction_t& hit
  , sampler_t& sampler
  , scattered_t& out)
  {
    auto wo = reflect(ray.wi.normalized(), hit.n);

    if (m.fuzz > 0.0f) {
      const auto u0 = sampler.sample();
      const auto u1 = sampler.sample();
      const auto u2 = sampler.sample();
      wo += sample::sphere::uniform_ball(u0, u1, u2) * std::min(m.fuzz, 1.0f);
    }

    // perturbed into the surface, the path is absorbed
    if (wo.dot(hit.ng) <= 0.0f || near_zero(wo)) {
      return false;
    }

    out.ray = ray_t(offset(hit.p, hit.ng), wo.normalized());
    out.attenuation = m.albedo;
    return true;
  }

  bool scatter_glass(
    const glass_t& m
  , const ray_t& ray
  , const interaction_t& hit
  , sampler_t& sampler
  , scattered_t& out)
  {
    // entering from outside, or leaving the medium
    const auto n1 = hit.front_face ? 1.0f : m.ior;
    const auto n2 = hit.front_face ? m.ior : 1.0f;

    const auto wi = ray.wi.normalized();
    const auto cos_theta = std::min(-wi.dot(hit.n), 1.0f);

    Imath::V3f refracted;
    const auto can_refract = refract(wi, hit.n, n1 / n2, refracted);

    const auto u = sampler.sample();

    if (!can_refract || fresnel::schlick(cos_theta, n1, n2) > u) {
      out.ray = ray_t(offset(hit.p, hit.ng), reflect(wi, hit.n));
    }
    else {
      out.ray = ray_t(offset(hit.p, hit.ng, true), refracted.normalized());
    }

    out.attenuation = Imath::Color3f(1.0f);
    return true;
  }
}

bool material_t::scatter(
  const ray_t& ray
, const interaction_t& hit
, sampler_t& sampler
, const std::vector<texture_t>& textures
, scattered_t& out) const
{
  switch (type()) {
  case type_t::Lambertian:
    return scatter_lambertian(std::get<lambertian_t>(model), hit, sampler, textures, out);
  case type_t::Metal:
    return scatter_metal(std::get<metal_t>(model), ray, hit, sampler, out);
  case type_t::Glass:
    return scatter_glass(std::get<glass_t>(model), ray, hit, sampler, out);
  case type_t::Emissive:
    return false;
  }
  return false;
}

Imath::Color3f material_t::emitted() const {
  if (type() == type_t::Emissive) {
    return std::get<emissive_t>(model).color;
  }
  return Imath::Color3f(0.0f);
}

Imath::Color3f material_t::diffuse(
  const interaction_t& hit
, const std::vector<texture_t>& textures) const
{
  if (type() == type_t::Lambertian) {
    return albedo(std::get<lambertian_t>(model), hit, textures);
  }
  return Imath::Color3f(0.0f);
}

bool material_t::texture(uint32_t& index) const {
  if (type() != type_t::Lambertian) {
    return false;
  }

  const auto& m = std::get<lambertian_t>(model);
  if (!m.is_textured()) {
    return false;
  }

  index = m.texture;
  return true;
}

material_t material_t::make_lambertian(const Imath::Color3f& albedo) {
  return material_t{lambertian_t{albedo, lambertian_t::NO_TEXTURE}};
}

material_t material_t::make_textured(uint32_t texture) {
  return material_t{lambertian_t{Imath::Color3f(1.0f), texture}};
}

material_t material_t::make_metal(const Imath::Color3f& albedo, float fuzz) {
  return material_t{metal_t{albedo, std::clamp(fuzz, 0.0f, 1.0f)}};
}

material_t material_t::make_glass(float ior) {
  return material_t{glass_t{ior}};
}

material_t material_t::make_emissive(const Imath::Color3f& color) {
  return material_t{emissive_t{color}};
}
