#include "obj.hpp"
#include "../mesh.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace codec {
  namespace obj {
    namespace {
      struct corner_t {
        uint32_t v, uv, n;
      };

      struct parser_t {
        const std::string& name;
        uint32_t line;

        uint32_t num_vertices;
        uint32_t num_normals;
        uint32_t num_uvs;

        mesh_t::builder_t::scoped_t builder;

        parser_t(const std::string& name, mesh_t& mesh)
          : name(name)
          , line(0)
          , num_vertices(0)
          , num_normals(0)
          , num_uvs(0)
          , builder(mesh.builder())
        {}

        std::runtime_error error(const std::string& what) const {
          return std::runtime_error(name + ":" + std::to_string(line) + ": " + what);
        }

        /* resolve a 1 based, or negative relative index into a 0 based one */
        uint32_t resolve(const std::string& token, uint32_t count, const char* kind) const {
          long i;
          try {
            size_t end;
            i = std::stol(token, &end);
            if (end != token.size()) {
              throw error(std::string("invalid ") + kind + " index " + token);
            }
          }
          catch (const std::logic_error&) {
            throw error(std::string("invalid ") + kind + " index " + token);
          }

          if (i < 0) {
            i += count;
          }
          else {
            i -= 1;
          }

          if (i < 0 || i >= (long) count) {
            throw error(std::string(kind) + " index " + token + " out of range");
          }
          return (uint32_t) i;
        }

        /* corners look like v, v/vt, v//vn or v/vt/vn */
        corner_t corner(const std::string& token) const {
          corner_t out = { mesh_t::NONE, mesh_t::NONE, mesh_t::NONE };

          const auto a = token.find('/');
          out.v = resolve(token.substr(0, a), num_vertices, "vertex");

          if (a == std::string::npos) {
            return out;
          }

          const auto b = token.find('/', a + 1);
          const auto uv = token.substr(a + 1, b == std::string::npos ? std::string::npos : b - a - 1);
          if (!uv.empty()) {
            out.uv = resolve(uv, num_uvs, "texture coordinate");
          }

          if (b != std::string::npos) {
            const auto n = token.substr(b + 1);
            if (!n.empty()) {
              out.n = resolve(n, num_normals, "normal");
            }
          }

          return out;
        }

        Imath::V3f vec3(std::istringstream& in) const {
          Imath::V3f v;
          if (!(in >> v.x >> v.y >> v.z)) {
            throw error("expected three numbers");
          }
          return v;
        }

        void face(std::istringstream& in) {
          std::vector<corner_t> corners;

          std::string token;
          while (in >> token) {
            corners.push_back(corner(token));
          }

          if (corners.size() < 3) {
            throw error("face with less than three vertices");
          }

          for (size_t i=1; i+1<corners.size(); ++i) {
            const corner_t* c[3] = { &corners[0], &corners[i], &corners[i+1] };

            mesh_t::face_t f;
            for (auto j=0; j<3; ++j) {
              f.v[j]  = c[j]->v;
              f.n[j]  = c[j]->n;
              f.uv[j] = c[j]->uv;
            }
            builder->add_face(f);
          }
        }

        void parse(const std::string& text) {
          ++line;

          std::istringstream in(text);

          std::string record;
          if (!(in >> record) || record[0] == '#') {
            return;
          }

          if (record == "v") {
            builder->add_vertex(vec3(in));
            ++num_vertices;
          }
          else if (record == "vn") {
            builder->add_normal(vec3(in));
            ++num_normals;
          }
          else if (record == "vt") {
            Imath::V2f uv;
            if (!(in >> uv.x >> uv.y)) {
              throw error("expected two numbers");
            }
            builder->add_uv(uv);
            ++num_uvs;
          }
          else if (record == "f") {
            face(in);
          }
        }
      };
    }

    void import(std::istream& in, const std::string& name, mesh_t& mesh) {
      parser_t parser(name, mesh);

      std::string text;
      while (std::getline(in, text)) {
        parser.parse(text);
      }
    }

    void import(const std::string& path, mesh_t& mesh) {
      std::ifstream in(path);
      if (!in) {
        throw std::runtime_error("Failed to open mesh: " + path);
      }

      import(in, path, mesh);
    }
  }
}
