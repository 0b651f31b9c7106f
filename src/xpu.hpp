#pragma once

#include <memory>
#include <string>
#include <vector>

struct frame_state_t;
struct parsed_options_t;
struct scene_t;

/**
 * A device that renders tiles. every device keeps its own acceleration
 * structure, and pulls work from the queue of the frame it was started
 * on, so devices of different kinds can share one frame
 */
struct xpu_t {
  typedef std::unique_ptr<xpu_t> scoped_t;

  virtual ~xpu_t();

  /* human readable description, for the log */
  virtual std::string name() const = 0;

  /* build the per device data of a scene, before rendering starts */
  virtual void preprocess(const scene_t& scene) = 0;

  /* start the workers of this device on a frame */
  virtual void start(const scene_t& scene, frame_state_t& frame) = 0;

  /* wait for the workers to exit, once the queue of the frame is
   * closed. rethrows the first error a worker ran into */
  virtual void join() = 0;

  /* the devices a render with these options runs on */
  static std::vector<scoped_t> discover(const parsed_options_t& options);
};
