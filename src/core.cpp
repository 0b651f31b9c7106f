#include "codecs/scene.hpp"
#include "film/file.hpp"
#include "film/progressive.hpp"
#include "options.hpp"
#include "renderer.hpp"
#include "scene.hpp"

#include <atomic>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>

#include <getopt.h>
#include <signal.h>

/* available arguments to the renderer */
static option options[] = {
  { "output",     required_argument, NULL, 'o' },
  { "one-thread", no_argument,       NULL, '1' },
  { "threads",    required_argument, NULL, 't' },
  { "spp",        required_argument, NULL, 's' },
  { "pass-spp",   required_argument, NULL, 'p' },
  { "depth",      required_argument, NULL, 'd' },
  { "roulette",   required_argument, NULL, 'R' },
  { "width",      required_argument, NULL, 'W' },
  { "height",     required_argument, NULL, 'H' },
  { "tile-size",  required_argument, NULL, 'T' },
  { "seed",       required_argument, NULL, 'S' },
  { "bvh",        required_argument, NULL, 'b' },
  { "export",     required_argument, NULL, 'e' },
  { "resume",     no_argument,       NULL, 'r' },
  { "affinity",   no_argument,       NULL, 'a' },
  { "verbose",    no_argument,       NULL, 'v' },
  { NULL,         0,                 NULL, 0   }
};

// the render a signal stops
static std::atomic<renderer_t*> active(nullptr);

void usage() {
  std::cerr
    << "usage: radiant <options> scene"
    << std::endl
    << "-o <path>    Progressive buffer the render goes to (out.film)" << std::endl
    << "-r           Resume rendering into an existing buffer" << std::endl
    << "-e <path>    Export the final image to path" << std::endl
    << "-s <samples> Anti Aliasing samples per pixel" << std::endl
    << "-p <samples> Samples per pixel added by every pass" << std::endl
    << "-d <depth>   Maximum depth of a single path" << std::endl
    << "-R <depth>   Russian roulette from this path depth on" << std::endl
    << "-t <threads> Number of worker threads" << std::endl
    << "-1           Only use one worker thread" << std::endl
    << "-a           Pin worker threads to cores" << std::endl
    << "-W <width>   Override the film width of the scene" << std::endl
    << "-H <height>  Override the film height of the scene" << std::endl
    << "-T <size>    Tile size in pixels" << std::endl
    << "-S <seed>    Base seed of the random numbers" << std::endl
    << "-b <split>   BVH split policy, sah or median" << std::endl
    << "-v           Print statistics while rendering" << std::endl;
}

static uint32_t number(const char* name, const char* arg) {
  return (uint32_t) args::number(name, arg);
}

bool parse_args(int argc, char** argv, parsed_options_t& parsed) {
  int ch;

  while ((ch = getopt_long(argc, argv, "1ravo:t:s:p:d:R:W:H:T:S:b:e:", options, nullptr)) != -1) {
    switch (ch) {
    case 'o':
      parsed.output = optarg;
      break;
    case 'e':
      parsed.image = optarg;
      break;
    case '1':
      std::cout << "Single threaded mode" << std::endl;
      parsed.single_threaded = true;
      break;
    case 't':
      parsed.threads = number("thread count", optarg);
      break;
    case 's':
      parsed.samples_per_pixel = number("sample count", optarg);
      std::cout << "Samples per pixel: " << parsed.samples_per_pixel << std::endl;
      break;
    case 'p':
      parsed.samples_per_pass = number("samples per pass", optarg);
      std::cout << "Samples per pass: " << parsed.samples_per_pass << std::endl;
      break;
    case 'd':
      parsed.path_depth = number("path depth", optarg);
      std::cout << "Path depth: " << parsed.path_depth << std::endl;
      break;
    case 'R':
      parsed.roulette_depth = number("roulette depth", optarg);
      break;
    case 'W':
      parsed.width = number("width", optarg);
      break;
    case 'H':
      parsed.height = number("height", optarg);
      break;
    case 'T':
      parsed.tile_size = number("tile size", optarg);
      break;
    case 'S':
      parsed.seed = args::number("seed", optarg, std::numeric_limits<uint64_t>::max());
      break;
    case 'b':
      if (std::strcmp(optarg, "sah") == 0) {
        parsed.split = bvh::policy_t::Sah;
      }
      else if (std::strcmp(optarg, "median") == 0) {
        parsed.split = bvh::policy_t::Median;
      }
      else {
        std::cerr << "Unknown BVH split policy: " << optarg << std::endl;
        return false;
      }
      break;
    case 'r':
      parsed.resume = true;
      break;
    case 'a':
      parsed.affinity = true;
      break;
    case 'v':
      parsed.verbose = true;
      break;
    case '?':
    default:
      return false;
    }
  }

  const auto remaining = argc - optind;

  if (remaining < 1) {
    std::cerr << "Need a scene file" << std::endl;
    return false;
  }

  if (remaining != 1) {
    std::cerr << "Unrecognized extra arguments: " << remaining - 1 << std::endl;
    return false;
  }

  // the last argument passed is the scene file we want to render
  parsed.scene = argv[optind];

  return true;
}

static void on_signal(int) {
  if (const auto renderer = active.load()) {
    renderer->stop();
  }
}

int main(int argc, char** argv) {
  try {
    parsed_options_t options;

    if (!parse_args(argc, argv, options)) {
      usage();
      return -1;
    }

    std::cout << "Importing scene: " << options.scene << std::endl;
    scene_t scene;
    codec::scene::import(options.scene, scene);

    if (options.width > 0) {
      scene.camera.film.width = options.width;
    }

    if (options.height > 0) {
      scene.camera.film.height = options.height;
    }

    renderer_t renderer;
    active = &renderer;

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);

    const auto done = renderer.render(scene, options);

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    active = nullptr;

    if (!options.image.empty()) {
      std::cout << "Exporting image: " << options.image << std::endl;

      const auto buffer = film::progressive_t::open_preview(options.output);

      film::file_t file(buffer->width, buffer->height, options.image);
      file.resolve(*buffer);
      file.finalize();
    }

    std::cout << "Done" << std::endl;
    return done ? 0 : 2;
  }
  catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
