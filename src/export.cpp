#include "film/file.hpp"
#include "film/progressive.hpp"

#include <iostream>
#include <stdexcept>

void usage() {
  std::cerr
    << "usage: radiant-export <buffer> <image>" << std::endl
    << "Writes the current estimate of a progressive buffer to an image." << std::endl
    << "The buffer may still be rendered to." << std::endl;
}

int main(int argc, char** argv) {
  if (argc != 3) {
    usage();
    return -1;
  }

  try {
    const auto buffer = film::progressive_t::open_preview(argv[1]);

    std::cout
      << "Exporting " << buffer->width << "x" << buffer->height
      << " at " << buffer->samples_per_pixel() << " samples per pixel"
      << std::endl;

    film::file_t file(buffer->width, buffer->height, argv[2]);
    file.resolve(*buffer);
    file.finalize();
  }
  catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
