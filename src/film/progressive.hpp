#pragma once

#include "../film.hpp"
#include "utils/nocopy.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace film {
  static const char     MAGIC[8] = { 'R', 'D', 'N', 'T', 'F', 'I', 'L', 'M' };
  static const uint32_t VERSION  = 1;

  /* The header at the start of a progressive buffer file. the pass
   * counters only advance once every tile of a pass has been committed */
  struct header_t {
    char     magic[8];
    uint32_t version;
    uint32_t width;
    uint32_t height;
    uint32_t pixel_size;

    std::atomic<uint32_t> passes;  // completed passes
    std::atomic<uint32_t> samples; // samples per pixel, of completed passes

    uint8_t reserved[32];
  };

  /* One pixel accumulator. seq is a sequence lock, it is odd while the
   * pixel is being written */
  struct pixel_t {
    std::atomic<uint32_t> seq;
    std::atomic<uint32_t> samples;
    std::atomic<float>    sum[3];
  };

  static_assert(sizeof(header_t) == 64, "unexpected header layout");
  static_assert(sizeof(pixel_t) == 20, "unexpected pixel layout");
  static_assert(std::atomic<uint32_t>::is_always_lock_free, "need lock free atomics in shared memory");
  static_assert(std::atomic<float>::is_always_lock_free, "need lock free atomics in shared memory");

  /**
   * A memory mapped accumulator of per pixel color sums and sample
   * counts. Workers add the samples of whole tiles, while other threads,
   * or other processes, may read pixels for previews at any time. The
   * file outlives the process, and a render can continue where a
   * previous one stopped
   */
  struct progressive_t : public film_t, nocopy_t {
    struct details_t;
    std::unique_ptr<details_t> details;

    header_t* header;
    pixel_t*  pixels;

    uint32_t width;
    uint32_t height;

    /* open a buffer for rendering. without 'resume' any existing file is
     * replaced by an empty buffer. with 'resume' an existing file is
     * reopened, and must match the requested size. a missing file is
     * created in both cases. throws on any mismatch, or OS error */
    progressive_t(
      const std::string& path
    , uint32_t width
    , uint32_t height
    , bool resume);

    ~progressive_t();

    /* map an existing buffer read only, for previews and export */
    static std::unique_ptr<progressive_t> open_preview(const std::string& path);

    void add_tile(
      const Imath::V2i& pos
    , const Imath::V2i& size
    , const render_buffer_t& buffer);

    /* add samples to a single pixel. only one thread may write a pixel
     * at any time */
    void add(uint32_t x, uint32_t y, const Imath::Color3f& sum, uint32_t count);

    /* consistent snapshot of a pixel. returns false if a writer kept the
     * pixel locked for too long */
    bool read(uint32_t x, uint32_t y, Imath::Color3f& sum, uint32_t& count) const;

    /* the estimate of a pixel, color sum over sample count */
    Imath::Color3f resolve(uint32_t x, uint32_t y) const;

    uint32_t samples(uint32_t x, uint32_t y) const;

    uint32_t passes() const;

    uint32_t samples_per_pixel() const;

    /* record a completed pass, that brought every pixel to 'spp' samples */
    void complete_pass(uint32_t spp);

    /* write the mapping back to disk */
    void flush();

    bool is_read_only() const;

    /* true if the buffer continues an existing file */
    bool is_resumed() const;

  private:
    progressive_t();
  };
}
