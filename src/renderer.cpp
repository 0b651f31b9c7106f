#include "renderer.hpp"
#include "frame.hpp"
#include "options.hpp"
#include "scene.hpp"
#include "xpu.hpp"
#include "film/progressive.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <sys/time.h>

namespace {
  inline double seconds_since(const timeval& start) {
    timeval end;
    gettimeofday(&end, 0);
    return (end.tv_sec - start.tv_sec) + ((end.tv_usec - start.tv_usec) / 1000000.0);
  }

  /* start the workers on construction, and make sure they are joined
   * on every way out of a render */
  struct devices_t {
    std::vector<xpu_t::scoped_t>& devices;
    frame_state_t& frame;
    bool joined;

    devices_t(std::vector<xpu_t::scoped_t>& devices, const scene_t& scene, frame_state_t& frame)
      : devices(devices), frame(frame), joined(false)
    {
      for (auto& device: devices) {
        device->start(scene, frame);
      }
    }

    ~devices_t() {
      if (!joined) {
        frame.stopped.store(true);
        frame.queue.close();
        for (auto& device: devices) {
          try {
            device->join();
          }
          catch (const std::exception& e) {
            std::cerr << "Worker failed: " << e.what() << std::endl;
          }
        }
      }
    }

    /* let the workers drain the queue and exit. rethrows worker errors */
    void join() {
      joined = true;
      frame.queue.close();
      for (auto& device: devices) {
        device->join();
      }
    }
  };
}

renderer_t::renderer_t()
  : stop_requested(false)
{}

void renderer_t::stop() {
  stop_requested.store(true);
}

bool renderer_t::render(const scene_t& scene, const parsed_options_t& options) {
  scene.validate();

  if (options.samples_per_pass == 0) {
    throw std::runtime_error("Samples per pass must be at least 1");
  }

  if (options.tile_size == 0) {
    throw std::runtime_error("Tile size must be at least 1");
  }

  const auto width  = scene.camera.film.width;
  const auto height = scene.camera.film.height;

  film::progressive_t film(options.output, width, height, options.resume);

  if (film.is_resumed()) {
    std::cout
      << "Resuming " << options.output
      << " after " << film.passes() << " passes, "
      << film.samples_per_pixel() << " samples per pixel"
      << std::endl;
  }

  std::cout << "Building BVH over " << scene.primitives.size() << " primitives" << std::endl;
  auto devices = xpu_t::discover(options);
  for (auto& device: devices) {
    if (options.verbose) {
      std::cout << "Device: " << device->name() << std::endl;
    }
    device->preprocess(scene);
  }

  frame_state_t frame(
    job::tiles_t::make(width, height, options.tile_size)
  , &film
  , options.seed
  , stop_requested);

  std::cout << "Rendering..." << std::endl;

  timeval start;
  gettimeofday(&start, 0);

  devices_t workers(devices, scene, frame);

  while (!stop_requested.load()) {
    const auto completed = film.samples_per_pixel();
    if (completed >= options.samples_per_pixel) {
      break;
    }

    const auto spp  = std::min(options.samples_per_pixel, completed + options.samples_per_pass);
    const auto pass = film.passes();

    timeval pass_start;
    gettimeofday(&pass_start, 0);

    frame.pass.reset(frame.tiles.size());
    for (auto i=0u; i<frame.tiles.size(); ++i) {
      frame.queue.push({ frame.tiles[i], spp });
    }

    // once stopped, the workers skip what is left of the pass, so the
    // pass always completes
    frame.pass.wait();

    if (stop_requested.load()) {
      break;
    }

    film.complete_pass(spp);

    std::cout << "Pass " << (pass + 1) << " done, " << spp << "/" << options.samples_per_pixel << " spp";
    if (options.verbose) {
      std::cout << ", " << frame.tiles.size() << " tiles in " << seconds_since(pass_start) << "s";
    }
    std::cout << std::endl;
  }

  workers.join();
  film.flush();

  const auto done = film.samples_per_pixel() >= options.samples_per_pixel;

  std::cout << "Rendering time: " << seconds_since(start) << std::endl;
  if (!done) {
    std::cout << "Stopped at " << film.samples_per_pixel() << " samples per pixel, resume with -r" << std::endl;
  }

  return done;
}
