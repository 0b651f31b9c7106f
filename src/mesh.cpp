#include "mesh.hpp"

#include <stdexcept>
#include <string>
#include <vector>

struct mesh_t::details_t {
  std::vector<Imath::V3f> vertices;
  std::vector<Imath::V3f> normals;
  std::vector<Imath::V2f> uvs;
  std::vector<face_t>     faces;
};

struct builder_impl_t : public mesh_t::builder_t {
  mesh_t* mesh;

  builder_impl_t(mesh_t* mesh)
    : mesh(mesh)
  {}

  void add_vertex(const Imath::V3f& v) {
    mesh->details->vertices.push_back(v);
  }

  void add_normal(const Imath::V3f& n) {
    mesh->details->normals.push_back(n);
  }

  void add_uv(const Imath::V2f& uv) {
    mesh->details->uvs.push_back(uv);
  }

  void add_face(const mesh_t::face_t& face) {
    mesh->details->faces.push_back(face);
  }
};

mesh_t::mesh_t()
  : details(new details_t())
{}

mesh_t::~mesh_t() {
  delete details;
}

mesh_t::builder_t* mesh_t::builder() {
  return new builder_impl_t(this);
}

uint32_t mesh_t::num_vertices() const {
  return details->vertices.size();
}

uint32_t mesh_t::num_normals() const {
  return details->normals.size();
}

uint32_t mesh_t::num_uvs() const {
  return details->uvs.size();
}

uint32_t mesh_t::num_faces() const {
  return details->faces.size();
}

const mesh_t::face_t& mesh_t::face(uint32_t i) const {
  return details->faces[i];
}

void mesh_t::triangles(
  uint32_t material
, bool smooth
, std::vector<primitive_t>& out) const
{
  out.reserve(out.size() + details->faces.size());

  for (auto i=0u; i<details->faces.size(); ++i) {
    const auto& f = details->faces[i];

    Imath::V3f v[3], n[3];
    Imath::V2f uv[3];

    auto has_normals = smooth;
    auto has_uvs = true;

    for (auto j=0; j<3; ++j) {
      if (f.v[j] >= details->vertices.size()) {
        throw std::runtime_error(
          "face " + std::to_string(i) + " refers to missing vertex " + std::to_string(f.v[j]));
      }
      v[j] = details->vertices[f.v[j]];

      if (f.n[j] == NONE) {
        has_normals = false;
      }
      else if (f.n[j] >= details->normals.size()) {
        throw std::runtime_error(
          "face " + std::to_string(i) + " refers to missing normal " + std::to_string(f.n[j]));
      }
      else {
        n[j] = details->normals[f.n[j]];
      }

      if (f.uv[j] == NONE) {
        has_uvs = false;
      }
      else if (f.uv[j] >= details->uvs.size()) {
        throw std::runtime_error(
          "face " + std::to_string(i) + " refers to missing uv " + std::to_string(f.uv[j]));
      }
      else {
        uv[j] = details->uvs[f.uv[j]];
      }
    }

    out.push_back(primitive_t::make_triangle(
      v
    , has_normals ? n : nullptr
    , has_uvs ? uv : nullptr
    , material));
  }
}
