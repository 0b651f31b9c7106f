#pragma once

#include "primitive.hpp"

#include <ImathVec.h>

#include <cstdint>
#include <memory>
#include <vector>

/* a mesh models a 3d obect in the scene, as an indexed triangle list
 * with optional normals and texture coordinates per face corner. meshes
 * only exist while a scene is imported, they get flattened into
 * triangle primitives when added to the scene */
struct mesh_t {
  struct details_t;

  details_t* details;

  // marks a face corner without a normal, or texture coordinate
  static constexpr uint32_t NONE = ~0u;

  struct face_t {
    uint32_t v[3];
    uint32_t n[3];
    uint32_t uv[3];
  };

  /* helper stuff to construct a mesh. mostly just here to hide
   * part of the implementation from you */
  struct builder_t {
    typedef std::unique_ptr<builder_t> scoped_t;

    virtual ~builder_t()
    {}

    virtual void add_vertex(const Imath::V3f& v) = 0;
    virtual void add_normal(const Imath::V3f& n) = 0;
    virtual void add_uv(const Imath::V2f& uv) = 0;
    virtual void add_face(const face_t& face) = 0;
  };

  mesh_t();
  ~mesh_t();

  mesh_t(const mesh_t&) = delete;
  mesh_t& operator=(const mesh_t&) = delete;

  builder_t* builder();

  uint32_t num_vertices() const;
  uint32_t num_normals() const;
  uint32_t num_uvs() const;
  uint32_t num_faces() const;

  const face_t& face(uint32_t i) const;

  /* get the triangles of this mesh with a material applied. with
   * 'smooth' set, vertex normals are used for shading where the faces
   * have them. throws if a face refers to a missing vertex, normal, or
   * texture coordinate */
  void triangles(
    uint32_t material
  , bool smooth
  , std::vector<primitive_t>& out) const;
};
