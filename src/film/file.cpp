#include "file.hpp"
#include "progressive.hpp"
#include "utils/color.hpp"
#include "utils/filesystem.hpp"

#include <OpenImageIO/imagebuf.h>

#include <stdexcept>

using namespace OIIO;

namespace film {
  struct file_t::details_t {
    std::string path;
    ImageBuf image;

    uint32_t width;
    uint32_t height;

    inline details_t(const std::string& path, uint32_t width, uint32_t height)
     : path(path)
     , image(ImageSpec(width, height, 3, TypeDesc::FLOAT))
     , width(width)
     , height(height)
    {}
  };

  file_t::file_t(uint32_t width, uint32_t height, const std::string& path)
    : details(new details_t(path, width, height))
  {}

  file_t::~file_t() {
  }

  void file_t::resolve(const progressive_t& buffer) {
    if (buffer.width != details->width || buffer.height != details->height) {
      throw std::runtime_error("Image size doesn't match the buffer size");
    }

    const auto hdr = is_hdr(details->path);

    for (auto y=0u; y<details->height; ++y) {
      for (auto x=0u; x<details->width; ++x) {
        auto c = buffer.resolve(x, y);
        if (!hdr) {
          c = color::gamma2(c);
        }

        const float rgb[3] = { c.x, c.y, c.z };
        details->image.setpixel(x, y, rgb, 3);
      }
    }
  }

  void file_t::finalize() {
    const auto format = is_hdr(details->path) ? TypeDesc::FLOAT : TypeDesc::UINT8;
    if (!details->image.write(details->path, format)) {
      throw std::runtime_error(
        "Failed to write image " + details->path + ": " + details->image.geterror());
    }
  }

  bool file_t::is_hdr(const std::string& path) {
    const auto ext = fs::extension(path);
    return ext == ".exr" || ext == ".hdr";
  }
}
