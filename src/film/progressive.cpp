#include "progressive.hpp"

#include "buffer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace film {
  namespace {
    // spins a reader does on a locked pixel, before giving up on it
    static const uint32_t MAX_READ_RETRIES = 1 << 16;

    inline std::runtime_error os_error(const std::string& what, const std::string& path) {
      return std::runtime_error(what + " " + path + ": " + strerror(errno));
    }

    inline size_t file_size(uint32_t width, uint32_t height) {
      return sizeof(header_t) + (size_t) width * height * sizeof(pixel_t);
    }

    inline void add_relaxed(std::atomic<float>& a, float f) {
      a.store(a.load(std::memory_order_relaxed) + f, std::memory_order_relaxed);
    }
  }

  struct progressive_t::details_t {
    std::string path;

    int    fd;
    void*  mem;
    size_t size;

    bool read_only;
    bool resumed;

    inline details_t(const std::string& path)
      : path(path)
      , fd(-1)
      , mem(MAP_FAILED)
      , size(0)
      , read_only(false)
      , resumed(false)
    {}

    inline ~details_t() {
      if (mem != MAP_FAILED) {
        munmap(mem, size);
      }
      if (fd >= 0) {
        close(fd);
      }
    }

    void map(int prot) {
      mem = mmap(nullptr, size, prot, MAP_SHARED, fd, 0);
      if (mem == MAP_FAILED) {
        throw os_error("Failed to map", path);
      }
    }

    /* create a new zeroed buffer file, replacing anything at path. the
     * buffer is set up under a temporary name and renamed over the old
     * file, so viewers that still map the old file keep a valid mapping */
    void create(uint32_t width, uint32_t height) {
      auto temp = path + ".XXXXXX";
      fd = mkstemp(&temp[0]);
      if (fd < 0) {
        throw os_error("Failed to create", path);
      }

      try {
        if (fchmod(fd, 0644) != 0) {
          throw os_error("Failed to create", path);
        }

        size = file_size(width, height);
        if (ftruncate(fd, size) != 0) {
          throw os_error("Failed to resize", path);
        }

        map(PROT_READ | PROT_WRITE);

        auto header = (header_t*) mem;
        memcpy(header->magic, MAGIC, sizeof(MAGIC));
        header->version    = VERSION;
        header->width      = width;
        header->height     = height;
        header->pixel_size = sizeof(pixel_t);
        header->passes.store(0);
        header->samples.store(0);

        if (rename(temp.c_str(), path.c_str()) != 0) {
          throw os_error("Failed to replace", path);
        }
      }
      catch (const std::runtime_error&) {
        unlink(temp.c_str());
        throw;
      }
    }

    /* open an existing buffer file, and check its header */
    void open_existing(int flags, int prot) {
      fd = open(path.c_str(), flags);
      if (fd < 0) {
        throw os_error("Failed to open", path);
      }

      struct stat st;
      if (fstat(fd, &st) != 0) {
        throw os_error("Failed to stat", path);
      }

      if ((size_t) st.st_size < sizeof(header_t)) {
        throw std::runtime_error("Corrupt buffer " + path + ": truncated header");
      }

      size = st.st_size;
      map(prot);

      const auto header = (const header_t*) mem;
      if (memcmp(header->magic, MAGIC, sizeof(MAGIC)) != 0) {
        throw std::runtime_error("Corrupt buffer " + path + ": bad magic");
      }

      if (header->version != VERSION) {
        throw std::runtime_error(
          "Corrupt buffer " + path + ": unsupported version " + std::to_string(header->version));
      }

      if (header->pixel_size != sizeof(pixel_t)) {
        throw std::runtime_error(
          "Corrupt buffer " + path + ": unexpected pixel size " + std::to_string(header->pixel_size));
      }

      if (header->width == 0 || header->height == 0
       || size < file_size(header->width, header->height)) {
        throw std::runtime_error("Corrupt buffer " + path + ": truncated pixel data");
      }
    }
  };

  progressive_t::progressive_t()
    : details(nullptr)
    , header(nullptr)
    , pixels(nullptr)
    , width(0)
    , height(0)
  {}

  progressive_t::progressive_t(
    const std::string& path
  , uint32_t _width
  , uint32_t _height
  , bool resume)
    : details(new details_t(path))
    , header(nullptr)
    , pixels(nullptr)
    , width(_width)
    , height(_height)
  {
    if (width == 0 || height == 0) {
      throw std::runtime_error("Buffer " + path + " must not be empty");
    }

    if (resume && access(path.c_str(), F_OK) == 0) {
      details->open_existing(O_RDWR, PROT_READ | PROT_WRITE);

      const auto h = (const header_t*) details->mem;
      if (h->width != width || h->height != height) {
        throw std::runtime_error(
          "Can't resume " + path + ": buffer is "
          + std::to_string(h->width) + "x" + std::to_string(h->height)
          + ", but the render is "
          + std::to_string(width) + "x" + std::to_string(height));
      }

      details->resumed = true;
    }
    else {
      details->create(width, height);
    }

    header = (header_t*) details->mem;
    pixels = (pixel_t*) ((char*) details->mem + sizeof(header_t));

    if (details->resumed) {
      // a writer that died in the middle of a pixel leaves it locked.
      // the partial sample can't be taken back, but readers mustn't wait
      // for it forever
      for (size_t i=0; i<(size_t) width * height; ++i) {
        const auto seq = pixels[i].seq.load(std::memory_order_relaxed);
        if (seq & 1) {
          pixels[i].seq.store(seq + 1, std::memory_order_relaxed);
        }
      }
    }
  }

  progressive_t::~progressive_t() {
  }

  std::unique_ptr<progressive_t> progressive_t::open_preview(const std::string& path) {
    std::unique_ptr<progressive_t> out(new progressive_t());
    out->details.reset(new details_t(path));
    out->details->read_only = true;
    out->details->open_existing(O_RDONLY, PROT_READ);

    out->header = (header_t*) out->details->mem;
    out->pixels = (pixel_t*) ((char*) out->details->mem + sizeof(header_t));
    out->width  = out->header->width;
    out->height = out->header->height;
    return out;
  }

  void progressive_t::add(uint32_t x, uint32_t y, const Imath::Color3f& sum, uint32_t count) {
    auto& p = pixels[(size_t) y * width + x];

    const auto seq = p.seq.load(std::memory_order_relaxed);
    p.seq.store(seq + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    add_relaxed(p.sum[0], sum.x);
    add_relaxed(p.sum[1], sum.y);
    add_relaxed(p.sum[2], sum.z);
    p.samples.store(p.samples.load(std::memory_order_relaxed) + count, std::memory_order_relaxed);

    p.seq.store(seq + 2, std::memory_order_release);
  }

  void progressive_t::add_tile(
    const Imath::V2i& pos
  , const Imath::V2i& size
  , const render_buffer_t& buffer)
  {
    if (details->read_only) {
      throw std::runtime_error("Buffer " + details->path + " is read only");
    }

    for (auto y=0; y<size.y; ++y) {
      for (auto x=0; x<size.x; ++x) {
        const auto count = buffer.count(x, y);
        if (count > 0) {
          add(pos.x + x, pos.y + y, buffer.sum(x, y), count);
        }
      }
    }
  }

  bool progressive_t::read(uint32_t x, uint32_t y, Imath::Color3f& sum, uint32_t& count) const {
    const auto& p = pixels[(size_t) y * width + x];

    for (auto i=0u; i<MAX_READ_RETRIES; ++i) {
      const auto s0 = p.seq.load(std::memory_order_acquire);
      if (s0 & 1) {
        std::this_thread::yield();
        continue;
      }

      const auto r = p.sum[0].load(std::memory_order_relaxed);
      const auto g = p.sum[1].load(std::memory_order_relaxed);
      const auto b = p.sum[2].load(std::memory_order_relaxed);
      const auto n = p.samples.load(std::memory_order_relaxed);

      std::atomic_thread_fence(std::memory_order_acquire);

      if (p.seq.load(std::memory_order_relaxed) == s0) {
        sum   = Imath::Color3f(r, g, b);
        count = n;
        return true;
      }
    }

    return false;
  }

  Imath::Color3f progressive_t::resolve(uint32_t x, uint32_t y) const {
    Imath::Color3f sum;
    uint32_t count;

    if (!read(x, y, sum, count)) {
      return Imath::Color3f(0.0f);
    }

    return sum / (float) std::max(count, 1u);
  }

  uint32_t progressive_t::samples(uint32_t x, uint32_t y) const {
    return pixels[(size_t) y * width + x].samples.load(std::memory_order_acquire);
  }

  uint32_t progressive_t::passes() const {
    return header->passes.load(std::memory_order_acquire);
  }

  uint32_t progressive_t::samples_per_pixel() const {
    return header->samples.load(std::memory_order_acquire);
  }

  void progressive_t::complete_pass(uint32_t spp) {
    header->samples.store(spp, std::memory_order_release);
    header->passes.fetch_add(1, std::memory_order_acq_rel);
  }

  void progressive_t::flush() {
    if (details->read_only) {
      return;
    }

    if (msync(details->mem, details->size, MS_SYNC) != 0) {
      throw os_error("Failed to sync", details->path);
    }
  }

  bool progressive_t::is_read_only() const {
    return details->read_only;
  }

  bool progressive_t::is_resumed() const {
    return details->resumed;
  }
}
