#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace fs {
  inline std::string basepath(const std::string& path) {
    const auto index = path.find_last_of('/');
    if (index != std::string::npos) {
      return path.substr(0, index);
    }
    return ".";
  }

  /* the lower case extension of path, including the dot */
  inline std::string extension(const std::string& path) {
    const auto slash = path.find_last_of('/');
    const auto index = path.find_last_of('.');
    if (index != std::string::npos && (slash == std::string::npos || index > slash)) {
      auto out = path.substr(index);
      std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return std::tolower(c);
      });
      return out;
    }
    return "";
  }

  /* resolve path relative to base, unless it is absolute */
  inline std::string join(const std::string& base, const std::string& path) {
    if (path.empty() || path[0] == '/' || base.empty()) {
      return path;
    }
    return base + "/" + path;
  }
}
