#pragma once

#include "light.hpp"
#include "material.hpp"
#include "primitive.hpp"
#include "texture.hpp"
#include "entities/camera.hpp"
#include "utils/color.hpp"
#include "utils/nocopy.hpp"

#include <ImathVec.h>

#include <string>
#include <vector>

struct mesh_t;

/* radiance of rays leaving the scene, a vertical gradient */
struct background_t {
  Imath::Color3f top;
  Imath::Color3f bottom;

  inline background_t()
    : top(1.0f, 1.0f, 1.0f)
    , bottom(0.2f, 0.2f, 0.8f)
  {}

  inline Imath::Color3f operator()(const Imath::V3f& wi) const {
    const auto d = wi.normalized();
    const auto t = 0.5f * (d.y + 1.0f);
    return color::lerp(bottom, top, t);
  }
};

/* The scene, as handed to the renderer. everything in here is read only
 * while rendering, and shared among all workers */
struct scene_t : nocopy_t {
  struct details_t;

  details_t* details;

  camera_t     camera;
  background_t background;

  std::vector<primitive_t> primitives;
  std::vector<material_t>  materials;
  std::vector<texture_t>   textures;
  std::vector<light_t>     lights;

  scene_t();
  ~scene_t();

  void reset();

  void add(const primitive_t& primitive);

  void add(const light_t& light);

  /* flatten a mesh into triangles with the given material */
  void add(const mesh_t& mesh, uint32_t material, bool smooth = true);

  /* add a named material, returns its index. names must be unique */
  uint32_t add(const std::string& name, const material_t& material);

  /* add a named texture, returns its index. names must be unique */
  uint32_t add(const std::string& name, texture_t texture);

  /* look up materials and textures by name. throws if there is no
   * such entity */
  uint32_t material(const std::string& name) const;
  uint32_t texture(const std::string& name) const;

  bool has_material(const std::string& name) const;
  bool has_texture(const std::string& name) const;

  /* check the references between the entities in the scene, and the
   * sanity of the geometry. throws std::runtime_error on the first
   * problem found */
  void validate() const;
};
