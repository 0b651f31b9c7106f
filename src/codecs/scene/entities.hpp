#pragma once

#include "math.hpp"
#include "entities/camera.hpp"
#include "../../light.hpp"
#include "../../scene.hpp"

#include <yaml-cpp/yaml.h>

/**
 * ! YAML importer code for all common renderer entities
 */
namespace YAML {
  /* ! Camera importer */
  template<>
  struct convert<camera_t> {
    static bool decode(const Node& node, camera_t& camera) {
      if (!node.IsMap()) {
        return false;
      }

      camera.position = node["position"].as<Imath::V3f>();
      camera.at       = node["at"].as<Imath::V3f>();
      camera.up       = node["up"].as<Imath::V3f>(Imath::V3f(0.0f, 1.0f, 0.0f));
      camera.fov      = node["fov"].as<float>(90.0f);

      camera.film.width  = node["width"].as<uint32_t>(camera.film.width);
      camera.film.height = node["height"].as<uint32_t>(camera.film.height);

      return true;
    }
  };

  /* ! Background gradient importer */
  template<>
  struct convert<background_t> {
    static bool decode(const Node& node, background_t& background) {
      if (!node.IsMap()) {
        return false;
      }

      background.top    = node["top"].as<Imath::Color3f>(background.top);
      background.bottom = node["bottom"].as<Imath::Color3f>(background.bottom);

      return true;
    }
  };

  /* ! Point light importer */
  template<>
  struct convert<light_t> {
    static bool decode(const Node& node, light_t& light) {
      if (!node.IsMap()) {
        return false;
      }

      light = light_t::make_point(
        node["position"].as<Imath::V3f>()
      , node["intensity"].as<Imath::Color3f>());

      return true;
    }
  };
}
