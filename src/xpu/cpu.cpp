#include "cpu.hpp"

#include "buffer.hpp"
#include "frame.hpp"
#include "options.hpp"
#include "sampling.hpp"
#include "scene.hpp"
#include "state.hpp"

#include "accel/bvh.hpp"

#include "kernels/cpu/camera.hpp"
#include "kernels/cpu/spt.hpp"

#include "utils/affinity.hpp"
#include "utils/allocator.hpp"
#include "utils/color.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct cpu_t::details_t {
  parsed_options_t options;

  std::vector<std::thread> threads;

  accel::bvh_t accel;

  // the first error raised by any of the workers
  std::mutex         error_lock;
  std::exception_ptr error;

  details_t(const parsed_options_t& options)    
    : options(options)
  {}

  void reset(const scene_t& scene) {
    accel.reset();
    accel.build(scene.primitives, options.split);

    if (options.verbose) {
      std::cout
        << "BVH with " << accel.num_nodes << " nodes, depth " << accel.depth
        << std::endl;
    }
  }

  void render(const scene_t& scene, frame_state_t& frame);

  void fail(frame_state_t& frame);
};

struct tile_renderer_t {
  frame_state_t& frame;

  // rendering kernel functions
  camera::pinhole_kernel_t camera_rays;
  spt::integrator_t        integrate;

  // per tile state
  allocator_t allocator;

  // output buffer for the rendered tile
  render_buffer_t buffer;

  inline tile_renderer_t(
    const parsed_options_t& options
  , const accel::bvh_t& accel
  , const scene_t& scene
  , frame_state_t& frame)
    : frame(frame)
    , camera_rays(scene.camera)
    , integrate(scene, accel, options.path_depth, options.roulette_depth)
    , allocator(allocator_size(options.tile_size))
  {}

  /* memory for the render buffer of a full tile, plus alignment */
  static inline size_t allocator_size(uint32_t tile_size) {
    const size_t pixels = (size_t) tile_size * tile_size;
    return pixels * (3 * sizeof(float) + sizeof(uint32_t)) + 2 * allocator_t::ALIGNMENT;
  }

  /* trace one sample of a pixel. the random stream is keyed by the
   * index of the sample in the pixel */
  inline Imath::Color3f sample(uint32_t x, uint32_t y, uint32_t index) {
    sampler_t sampler(frame.seed, x, y, index);

    const auto jitter = sampler.sample2();
    const auto ray = camera_rays(x, y, jitter);

    const auto r = integrate(ray, sampler);

    // a single broken path must not poison the pixel
    if (!color::is_finite(r)) {
      return Imath::Color3f(0.0f);
    }
    return r;
  }

  /* bring every pixel of a tile to the sample count of the pass, and
   * commit the new samples to the film in one go */
  inline void render_tile(const job::work_t& work) {
    const auto& tile = work.tile;

    allocator_scope_t tile_scope(allocator);
    buffer.allocate(allocator, tile.w, tile.h);

    for (auto y=0u; y<tile.h; ++y) {
      for (auto x=0u; x<tile.w; ++x) {
        const auto px = tile.x + x;
        const auto py = tile.y + y;

        const auto count = frame.film->samples(px, py);
        for (auto i=count; i<work.spp; ++i) {
          buffer.add(x, y, sample(px, py, i));
        }
      }
    }

    frame.film->add_tile(
      Imath::V2i(tile.x, tile.y)
    , Imath::V2i(tile.w, tile.h)
    , buffer);
  }
};

void cpu_t::details_t::fail(frame_state_t& frame) {
  // halt the frame, and hand the error to whoever joins us
  {
    std::lock_guard<std::mutex> lock(error_lock);
    if (!error) {
      error = std::current_exception();
    }
  }
  frame.stopped.store(true, std::memory_order_release);
}

void cpu_t::details_t::render(const scene_t& scene, frame_state_t& frame) {
  std::unique_ptr<tile_renderer_t> renderer;
  try {
    renderer.reset(new tile_renderer_t(options, accel, scene, frame));
  }
  catch (...) {
    fail(frame);
  }

  // a worker keeps draining the queue even after a failure, so the
  // pass still completes
  job::work_t work;
  while (frame.queue.pop(work)) {
    // once stopped, the rest of the pass is skipped. tiles are the
    // smallest unit of work, so the film never sees half a tile
    if (renderer && !frame.stopped.load(std::memory_order_acquire)) {
      try {
        renderer->render_tile(work);
      }
      catch (...) {
        fail(frame);
      }
    }
    frame.pass.done();
  }
}

cpu_t::cpu_t(const parsed_options_t& options)
  : details(new details_t(options))
  , concurrency(options.single_threaded ? 1 : options.threads)
{
  if (concurrency == 0) {
    concurrency = std::max(1u, std::thread::hardware_concurrency());
  }
}

cpu_t::~cpu_t() {
  delete details;
}

std::string cpu_t::name() const {
  return "cpu, " + std::to_string(concurrency) + " threads";
}

void cpu_t::preprocess(const scene_t& scene) {
  details->reset(scene);
}

void cpu_t::start(const scene_t& scene, frame_state_t& frame) {
  for (auto i=0u; i<concurrency; ++i) {
    details->threads.push_back(std::thread(
      [i, this](const scene_t& scene, frame_state_t& frame) {
        if (details->options.affinity) {
          affinity::pin(i);
        }

        details->render(scene, frame);
      }, std::cref(scene), std::ref(frame)));
  }
}

void cpu_t::join() {
  for (auto& thread : details->threads) {
    thread.join();
  }
  details->threads.clear();

  if (details->error) {
    auto error = details->error;
    details->error = nullptr;
    std::rethrow_exception(error);
  }
}

cpu_t* cpu_t::make(const parsed_options_t& options) {
  return new cpu_t(options);
}
