#pragma once

#include "film.hpp"
#include "jobs/tiles.hpp"

#include <atomic>
#include <cstdint>

/* State of the frame being rendered, shared between the scheduling
 * thread and the workers of all devices */
struct frame_state_t {
  // the tiles of one pass over the image
  job::tiles_t tiles;
  // tiles scheduled for rendering
  job::queue_t<job::work_t> queue;
  // tiles of the current pass still in flight
  job::pass_t pass;
  // receives finished tiles
  film_t* film;
  // base seed of all random streams
  uint64_t seed;
  // set once rendering should halt. workers skip the remaining tiles
  std::atomic<bool>& stopped;

  inline frame_state_t(
    const job::tiles_t& tiles
  , film_t* film
  , uint64_t seed
  , std::atomic<bool>& stopped)
    : tiles(tiles)
    , film(film)
    , seed(seed)
    , stopped(stopped)
  {}
};
