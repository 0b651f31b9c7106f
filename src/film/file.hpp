#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace film {
  struct progressive_t;

  /* Converts the estimates of a progressive buffer into an image file,
   * written with OpenImageIO. HDR formats get linear floats, everything
   * else gamma 2 and 8 bits per channel */
  struct file_t {
    struct details_t; 
    std::unique_ptr<details_t> details;

    file_t(uint32_t width, uint32_t height, const std::string& path);
    ~file_t();

    /* copy the resolved pixels of a buffer with the same size */
    void resolve(const progressive_t& buffer);

    /* write the image. throws if OpenImageIO can't write it */
    void finalize();

    static bool is_hdr(const std::string& path);
  };
}
