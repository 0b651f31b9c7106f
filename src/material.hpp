#pragma once

#include "state.hpp"
#include "utils/color.hpp"

#include <cstdint>
#include <variant>
#include <vector>

struct sampler_t;
struct texture_t;

/* diffuse reflection, with either a constant albedo, or one looked up
 * from a texture */
struct lambertian_t {
  static constexpr uint32_t NO_TEXTURE = ~0u;

  Imath::Color3f albedo;
  uint32_t       texture;

  inline bool is_textured() const {
    return texture != NO_TEXTURE;
  }
};

struct metal_t {
  Imath::Color3f albedo;
  // radius of the ball, the reflected direction gets perturbed by
  float fuzz;
};

struct glass_t {
  float ior;
};

struct emissive_t {
  Imath::Color3f color;
};

/* result of scattering a ray at a surface */
struct scattered_t {
  ray_t          ray;
  Imath::Color3f attenuation;
};

/* Materials are a closed set of shading models, stored by value and
 * shared by index among the primitives. they are never mutated while
 * rendering */
struct material_t {
  enum class type_t : uint8_t {
    Lambertian = 0,
    Metal      = 1,
    Glass      = 2,
    Emissive   = 3
  };

  std::variant<lambertian_t, metal_t, glass_t, emissive_t> model;

  inline type_t type() const {
    return static_cast<type_t>(model.index());
  }

  /* sample a continuation of a path at a surface. returns false if the
   * path gets absorbed, or the material doesn't scatter at all */
  bool scatter(
    const ray_t& ray
  , const interaction_t& hit
  , sampler_t& sampler
  , const std::vector<texture_t>& textures
  , scattered_t& out) const;

  /* radiance emitted by the surface towards the viewer */
  Imath::Color3f emitted() const;

  /* reflectance of a diffuse surface at a hit, black for all other
   * materials. used for direct light estimation */
  Imath::Color3f diffuse(
    const interaction_t& hit
  , const std::vector<texture_t>& textures) const;

  /* the texture a material refers to, if any */
  bool texture(uint32_t& index) const;

  static material_t make_lambertian(const Imath::Color3f& albedo);

  static material_t make_textured(uint32_t texture);

  static material_t make_metal(const Imath::Color3f& albedo, float fuzz);

  static material_t make_glass(float ior);

  static material_t make_emissive(const Imath::Color3f& color);
};
