#pragma once

#include "math.hpp"
#include "../../material.hpp"
#include "../../scene.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace codec {
  namespace scene {
    namespace material {
      /* ! decodes a material. textures are referred to by name, so they
       * must have been added to the scene before */
      inline material_t decode(
        const std::string& name
      , const YAML::Node& node
      , const scene_t& scene)
      {
        if (!node.IsMap()) {
          throw std::runtime_error("Material " + name + " is not a map");
        }

        const auto type = node["type"].as<std::string>("lambertian");

        if (type == "lambertian") {
          if (const auto texture = node["texture"]) {
            return material_t::make_textured(scene.texture(texture.as<std::string>()));
          }
          return material_t::make_lambertian(
            node["albedo"].as<Imath::Color3f>(Imath::Color3f(0.5f)));
        }
        else if (type == "metal") {
          return material_t::make_metal(
            node["albedo"].as<Imath::Color3f>(Imath::Color3f(0.5f))
          , node["fuzz"].as<float>(0.0f));
        }
        else if (type == "glass") {
          const auto ior = node["ior"].as<float>(1.5f);
          if (!(ior > 0.0f)) {
            throw std::runtime_error("Material " + name + " needs a positive ior");
          }
          return material_t::make_glass(ior);
        }
        else if (type == "emissive") {
          return material_t::make_emissive(
            node["color"].as<Imath::Color3f>(Imath::Color3f(1.0f)));
        }

        throw std::runtime_error("Material " + name + " has unknown type: " + type);
      }
    }
  }
}
