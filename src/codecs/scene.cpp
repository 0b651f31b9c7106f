#include "scene.hpp"
#include "obj.hpp"
#include "../mesh.hpp"
#include "../scene.hpp"
#include "scene/entities.hpp"
#include "scene/material.hpp"
#include "scene/math.hpp"
#include "utils/filesystem.hpp"

#include <yaml-cpp/yaml.h>

#include <iostream>
#include <stdexcept>

namespace codec {
  namespace scene {
    namespace {
      texture_t::filter_t filter(const std::string& name, const std::string& value) {
        if (value == "nearest") {
          return texture_t::filter_t::Nearest;
        }
        else if (value == "bilinear") {
          return texture_t::filter_t::Bilinear;
        }
        throw std::runtime_error("Texture " + name + " has unknown filter: " + value);
      }

      void import_textures(const YAML::Node& textures, const std::string& base, scene_t& scene) {
        for (auto i=textures.begin(); i!=textures.end(); ++i) {
          const auto name = i->first.as<std::string>();
          const auto path = fs::join(base, i->second["path"].as<std::string>());
          const auto f    = filter(name, i->second["filter"].as<std::string>("bilinear"));

          std::cout << "Texture: " << name << " (" << path << ")" << std::endl;
          scene.add(name, texture_t::load(path, f));
        }
      }

      void import_materials(const YAML::Node& materials, scene_t& scene) {
        for (auto i=materials.begin(); i!=materials.end(); ++i) {
          const auto name = i->first.as<std::string>();
          scene.add(name, material::decode(name, i->second, scene));
        }
      }

      void import_object(const YAML::Node& node, const std::string& base, scene_t& scene) {
        const auto type     = node["type"].as<std::string>();
        const auto material = scene.material(node["material"].as<std::string>());

        if (type == "sphere") {
          scene.add(primitive_t::make_sphere(
            node["center"].as<Imath::V3f>()
          , node["radius"].as<float>()
          , material));
        }
        else if (type == "plane") {
          scene.add(primitive_t::make_plane(
            node["point"].as<Imath::V3f>()
          , node["normal"].as<Imath::V3f>()
          , material));
        }
        else if (type == "triangle") {
          const auto vertices = node["vertices"];
          if (!vertices.IsSequence() || vertices.size() != 3) {
            throw std::runtime_error("Triangle needs three vertices");
          }

          Imath::V3f v[3], n[3];
          Imath::V2f uv[3];

          const auto normals = node["normals"];
          const auto uvs     = node["uvs"];

          if (normals && (!normals.IsSequence() || normals.size() != 3)) {
            throw std::runtime_error("Triangle needs three normals");
          }

          if (uvs && (!uvs.IsSequence() || uvs.size() != 3)) {
            throw std::runtime_error("Triangle needs three texture coordinates");
          }

          for (auto j=0; j<3; ++j) {
            v[j] = vertices[j].as<Imath::V3f>();
            if (normals) {
              n[j] = normals[j].as<Imath::V3f>();
            }
            if (uvs) {
              uv[j] = uvs[j].as<Imath::V2f>();
            }
          }

          scene.add(primitive_t::make_triangle(
            v
          , normals ? n : nullptr
          , uvs ? uv : nullptr
          , material));
        }
        else if (type == "mesh") {
          const auto path = fs::join(base, node["path"].as<std::string>());
          std::cout << "Importing mesh: " << path << std::endl;

          mesh_t mesh;
          codec::obj::import(path, mesh);
          scene.add(mesh, material, node["smooth"].as<bool>(true));
        }
        else {
          throw std::runtime_error("Unknown object type: " + type);
        }
      }
    }

    void import(const YAML::Node& config, const std::string& base, scene_t& scene) {
      // import manual camera settings from the configuration
      if (const auto camera = config["camera"]) {
        scene.camera = camera.as<camera_t>();
      }

      // import world settings
      if (const auto world = config["world"]) {
        if (const auto background = world["background"]) {
          scene.background = background.as<background_t>();
        }
      }

      if (const auto textures = config["textures"]) {
        std::cout << "Importing textures" << std::endl;
        import_textures(textures, base, scene);
      }

      if (const auto materials = config["materials"]) {
        std::cout << "Importing materials" << std::endl;
        import_materials(materials, scene);
      }

      if (const auto lights = config["lights"]) {
        for (auto i=lights.begin(); i!=lights.end(); ++i) {
          scene.add(i->as<light_t>());
        }
      }

      if (const auto objects = config["objects"]) {
        std::cout << "Importing scene data" << std::endl;
        for (auto i=objects.begin(); i!=objects.end(); ++i) {
          import_object(*i, base, scene);
        }
      }

      std::cout
        << "Scene has " << scene.primitives.size() << " primitives, "
        << scene.materials.size() << " materials, "
        << scene.lights.size() << " lights"
        << std::endl;

      scene.validate();
    }

    void import(const std::string& path, scene_t& scene) {
      const auto config = YAML::LoadFile(path);
      import(config, fs::basepath(path), scene);
    }
  }
}
