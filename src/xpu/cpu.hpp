#pragma once

#include "../xpu.hpp"

#include <cstdint>
#include <string>

struct frame_state_t;
struct parsed_options_t;
struct scene_t;

/* Renders tiles on a pool of host threads */
struct cpu_t : public xpu_t {
  struct details_t;

  details_t* details;

  // number of worker threads on this cpu
  uint32_t concurrency;

  cpu_t(const parsed_options_t& options);
  ~cpu_t();

  std::string name() const;

  // build the BVH over the primitives of the scene
  void preprocess(const scene_t& scene);

  // start one worker per thread of concurrency
  void start(const scene_t& scene, frame_state_t& frame);

  void join();

  static cpu_t* make(const parsed_options_t& options);
};
