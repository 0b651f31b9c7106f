#pragma once

#include <istream>
#include <string>

struct mesh_t;

namespace codec {
  namespace obj {
    /**
     * ! Imports the geometry of a wavefront OBJ file at 'path' into a
     * mesh. Polygons are split into triangle fans. Materials, groups and
     * all other records are ignored. Throws if the file can't be read,
     * or refers to missing vertex data
     */
    void import(const std::string& path, mesh_t& mesh);

    void import(std::istream& in, const std::string& name, mesh_t& mesh);
  }
}
