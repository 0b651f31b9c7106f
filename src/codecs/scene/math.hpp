#pragma once

#include <ImathColor.h>
#include <ImathVec.h>

#include <yaml-cpp/yaml.h>

/**
 * ! YAML importer code for the math types
 */
namespace YAML {
  /* ! 3d vector importer */
  template<>
  struct convert<Imath::V3f> {
    static bool decode(const Node& node, Imath::V3f& v) {
      if (!node.IsSequence() || node.size() != 3) {
        return false;
      }

      v = Imath::V3f(
        node[0].as<float>()
      , node[1].as<float>()
      , node[2].as<float>());

      return true;
    }
  };

  /* ! 2d vector importer, for texture coordinates */
  template<>
  struct convert<Imath::V2f> {
    static bool decode(const Node& node, Imath::V2f& v) {
      if (!node.IsSequence() || node.size() != 2) {
        return false;
      }

      v = Imath::V2f(
        node[0].as<float>()
      , node[1].as<float>());

      return true;
    }
  };

  /* ! rgb color importer. a single number is a grey value */
  template<>
  struct convert<Imath::Color3f> {
    static bool decode(const Node& node, Imath::Color3f& c) {
      if (node.IsScalar()) {
        c = Imath::Color3f(node.as<float>());
        return true;
      }

      if (!node.IsSequence() || node.size() != 3) {
        return false;
      }

      c = Imath::Color3f(
        node[0].as<float>()
      , node[1].as<float>()
      , node[2].as<float>());

      return true;
    }
  };
}
