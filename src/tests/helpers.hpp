#pragma once

#include "accel/intersect.hpp"
#include "primitive.hpp"
#include "state.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace test {
  /* a file path in the temp directory, unique per test, removed again
   * when the test ends */
  struct temp_file_t {
    std::string path;

    inline explicit temp_file_t(const std::string& name) {
      const auto info = ::testing::UnitTest::GetInstance()->current_test_info();
      path = ::testing::TempDir()
        + "radiant_" + info->test_suite_name() + "_" + info->name()
        + "_" + std::to_string(getpid()) + "_" + name;
      std::remove(path.c_str());
    }

    inline ~temp_file_t() {
      std::remove(path.c_str());
    }

    inline void write(const std::string& content) const {
      std::ofstream out(path, std::ios::binary | std::ios::trunc);
      out << content;
    }
  };

  /* closest hit by testing every primitive, in order */
  inline bool brute_force(
    const std::vector<primitive_t>& primitives
  , const ray_t& ray
  , float& t
  , uint32_t& index)
  {
    auto tmax = ray.tmax;
    auto found = false;

    for (auto i=0u; i<primitives.size(); ++i) {
      float d;
      Imath::V2f uv;
      if (accel::intersect::primitive(primitives[i], ray, tmax, d, uv) && d < tmax) {
        tmax  = d;
        index = i;
        found = true;
      }
    }

    t = tmax;
    return found;
  }
}
