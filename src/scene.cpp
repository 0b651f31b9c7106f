#include "scene.hpp"
#include "mesh.hpp"
#include "math/vector.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

struct scene_t::details_t {
  std::unordered_map<std::string, uint32_t> materials_by_name;
  std::unordered_map<std::string, uint32_t> textures_by_name;
};

scene_t::scene_t()
  : details(new details_t()) {
}

scene_t::~scene_t() {
  delete details;
}

void scene_t::reset() {
  camera = camera_t();
  background = background_t();

  primitives.clear();
  materials.clear();
  textures.clear();
  lights.clear();

  details->materials_by_name.clear();
  details->textures_by_name.clear();
}

void scene_t::add(const primitive_t& primitive) {
  primitives.push_back(primitive);
}

void scene_t::add(const light_t& light) {
  lights.push_back(light);
}

void scene_t::add(const mesh_t& mesh, uint32_t material, bool smooth) {
  mesh.triangles(material, smooth, primitives);
}

uint32_t scene_t::add(const std::string& name, const material_t& material) {
  if (has_material(name)) {
    throw std::runtime_error("Duplicate material: " + name);
  }

  const uint32_t id = materials.size();
  materials.push_back(material);
  details->materials_by_name[name] = id;

  std::cout << "Adding material: " << name << ", with id: " << id << std::endl;
  return id;
}

uint32_t scene_t::add(const std::string& name, texture_t texture) {
  if (has_texture(name)) {
    throw std::runtime_error("Duplicate texture: " + name);
  }

  const uint32_t id = textures.size();
  textures.push_back(std::move(texture));
  details->textures_by_name[name] = id;
  return id;
}

uint32_t scene_t::material(const std::string& name) const {
  const auto guard = details->materials_by_name.find(name);
  if (guard == details->materials_by_name.end()) {
    throw std::runtime_error("Unknown material: " + name);
  }
  return guard->second;
}

uint32_t scene_t::texture(const std::string& name) const {
  const auto guard = details->textures_by_name.find(name);
  if (guard == details->textures_by_name.end()) {
    throw std::runtime_error("Unknown texture: " + name);
  }
  return guard->second;
}

bool scene_t::has_material(const std::string& name) const {
  return details->materials_by_name.count(name) > 0;
}

bool scene_t::has_texture(const std::string& name) const {
  return details->textures_by_name.count(name) > 0;
}

void scene_t::validate() const {
  if (camera.film.width == 0 || camera.film.height == 0) {
    throw std::runtime_error("Camera film has zero size");
  }

  if (!(camera.fov > 0.0f && camera.fov < 180.0f)) {
    throw std::runtime_error("Camera field of view must be in (0, 180) degrees");
  }

  if (!is_finite(camera.position) || !is_finite(camera.at) || !is_finite(camera.up)
   || (camera.at - camera.position).cross(camera.up).length2() == 0.0f) {
    throw std::runtime_error("Camera orientation is degenerate");
  }

  for (auto i=0u; i<materials.size(); ++i) {
    uint32_t t;
    if (materials[i].texture(t) && t >= textures.size()) {
      throw std::runtime_error(
        "Material " + std::to_string(i) + " refers to missing texture " + std::to_string(t));
    }
  }

  for (auto i=0u; i<primitives.size(); ++i) {
    const auto& p = primitives[i];
    if (p.material >= materials.size()) {
      throw std::runtime_error(
        "Primitive " + std::to_string(i) + " refers to missing material " + std::to_string(p.material));
    }

    if (!p.is_finite()) {
      throw std::runtime_error(
        "Primitive " + std::to_string(i) + " has non finite coordinates");
    }
  }

  for (auto i=0u; i<lights.size(); ++i) {
    if (!is_finite(lights[i].position) || !color::is_finite(lights[i].intensity)) {
      throw std::runtime_error(
        "Light " + std::to_string(i) + " has non finite parameters");
    }
  }
}
