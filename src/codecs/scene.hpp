#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

struct scene_t;

namespace codec {
  namespace scene {
    /**
     * ! Imports a scene description in YAML format fromn 'path'
     * and writes the results to 'scene'. the scene is validated
     * after the import
     */
    void import(const std::string& path, scene_t& scene);

    /**
     * ! Imports a scene from a parsed YAML document. relative file
     * paths in the document are resolved against 'base'
     */
    void import(const YAML::Node& config, const std::string& base, scene_t& scene);
  }
}
