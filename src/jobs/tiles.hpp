#pragma once

#include "utils/nocopy.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace job {
  /* A rectangular region of the image, rendered as one unit of work.
   * tiles of one partition never overlap */
  struct tile_t {
    uint32_t x, y;
    uint32_t w, h;

    uint32_t num_pixels() const {
      return w*h;
    }
  };

  /* a tile scheduled for one sampling pass */
  struct work_t {
    tile_t   tile;
    // sample count every pixel of the tile is brought to
    uint32_t spp;
  };

  /* A set of precomputed tiles covering an image */
  struct tiles_t {
    std::vector<tile_t> tiles;

    inline uint32_t size() const {
      return tiles.size();
    }

    inline const tile_t& operator[](uint32_t i) const {
      return tiles[i];
    }

    static tiles_t make(
      uint32_t width
    , uint32_t height
    , uint32_t tile_size)
    {
      tiles_t out;

      if (width == 0 || height == 0 || tile_size == 0) {
        return out;
      }

      auto htiles = width / tile_size;
      auto vtiles = height / tile_size;

      const auto rh = height - tile_size * vtiles;
      const auto rw = width - tile_size * htiles;

      if (rh > 0) {
        vtiles++;
      }

      if (rw > 0) {
        htiles++;
      }

      out.tiles.resize(htiles*vtiles);

      for (auto y=0u; y<vtiles; ++y) {
        for (auto x=0u; x<htiles; ++x) {
          auto tw = tile_size;
          auto th = tile_size;

          if (y == vtiles-1 && rh > 0) {
            th = rh;
          }

          if (x == htiles-1 && rw > 0) {
            tw = rw;
          }

          out.tiles[y * htiles + x] = { x*tile_size, y*tile_size, tw, th };
        }
      }

      return out;
    }
  };

  /* Work queue shared by all workers. pop() blocks while the queue is
   * empty but open, and fails once the queue is closed and drained */
  template<typename T>
  struct queue_t : nocopy_t {
    std::mutex              m;
    std::condition_variable cv;
    std::deque<T>           items;
    bool                    closed;

    inline queue_t()
      : closed(false)
    {}

    inline bool push(const T& item) {
      {
        std::lock_guard<std::mutex> lock(m);
        if (closed) {
          return false;
        }
        items.push_back(item);
      }
      cv.notify_one();
      return true;
    }

    inline bool pop(T& out) {
      std::unique_lock<std::mutex> lock(m);
      cv.wait(lock, [this]() { return !items.empty() || closed; });

      if (items.empty()) {
        return false;
      }

      out = items.front();
      items.pop_front();
      return true;
    }

    /* no more work gets accepted. workers drain what is left, and exit */
    inline void close() {
      {
        std::lock_guard<std::mutex> lock(m);
        closed = true;
      }
      cv.notify_all();
    }

    inline size_t size() {
      std::lock_guard<std::mutex> lock(m);
      return items.size();
    }
  };

  /* Counts down the tiles of one pass, so the scheduler can wait for a
   * pass to complete before it starts the next one */
  struct pass_t : nocopy_t {
    std::mutex              m;
    std::condition_variable cv;
    uint32_t                remaining;

    inline pass_t()
      : remaining(0)
    {}

    inline void reset(uint32_t tiles) {
      std::lock_guard<std::mutex> lock(m);
      remaining = tiles;
    }

    inline void done() {
      {
        std::lock_guard<std::mutex> lock(m);
        if (remaining > 0) {
          --remaining;
        }
      }
      cv.notify_all();
    }

    /* wait until all tiles of the pass are done, or skipped */
    inline void wait() {
      std::unique_lock<std::mutex> lock(m);
      cv.wait(lock, [this]() { return remaining == 0; });
    }
  };
}
