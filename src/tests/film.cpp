#include "buffer.hpp"
#include "film/file.hpp"
#include "film/progressive.hpp"
#include "utils/allocator.hpp"

#include "helpers.hpp"

#include <OpenImageIO/imageio.h>

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

using film::progressive_t;

TEST(Progressive, CreatesEmptyBuffer) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 8, 4, false);
  EXPECT_FALSE(buffer.is_resumed());
  EXPECT_FALSE(buffer.is_read_only());
  EXPECT_EQ(buffer.passes(), 0u);
  EXPECT_EQ(buffer.samples_per_pixel(), 0u);

  for (auto y=0u; y<4; ++y) {
    for (auto x=0u; x<8; ++x) {
      EXPECT_EQ(buffer.samples(x, y), 0u);
      EXPECT_EQ(buffer.resolve(x, y), Imath::Color3f(0.0f));
    }
  }

  std::ifstream in(file.path, std::ios::binary | std::ios::ate);
  EXPECT_EQ((size_t) in.tellg(), sizeof(film::header_t) + 8 * 4 * sizeof(film::pixel_t));
}

TEST(Progressive, AccumulatesSamples) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 4, 4, false);
  buffer.add(1, 2, Imath::Color3f(1.0f, 2.0f, 3.0f), 2);
  buffer.add(1, 2, Imath::Color3f(1.0f, 0.0f, 1.0f), 2);

  Imath::Color3f sum;
  uint32_t count;
  ASSERT_TRUE(buffer.read(1, 2, sum, count));
  EXPECT_EQ(sum, Imath::Color3f(2.0f, 2.0f, 4.0f));
  EXPECT_EQ(count, 4u);
  EXPECT_EQ(buffer.resolve(1, 2), Imath::Color3f(0.5f, 0.5f, 1.0f));
  EXPECT_EQ(buffer.samples(2, 1), 0u);
}

TEST(Progressive, AddTile) {
  test::temp_file_t file("film");
  progressive_t buffer(file.path, 16, 16, false);

  allocator_t allocator(1 << 16);
  render_buffer_t tile;
  tile.allocate(allocator, 4, 2);
  tile.add(0, 0, Imath::Color3f(1.0f));
  tile.add(3, 1, Imath::Color3f(0.5f));
  tile.add(3, 1, Imath::Color3f(0.5f));

  film_t& f = buffer;
  f.add_tile(Imath::V2i(8, 4), Imath::V2i(4, 2), tile);

  EXPECT_EQ(buffer.samples(8, 4), 1u);
  EXPECT_EQ(buffer.samples(11, 5), 2u);
  EXPECT_EQ(buffer.resolve(11, 5), Imath::Color3f(0.5f));

  // pixels without samples in the tile are left alone
  EXPECT_EQ(buffer.samples(9, 4), 0u);
  EXPECT_EQ(buffer.samples(0, 0), 0u);
}

TEST(Progressive, ResumeKeepsSamples) {
  test::temp_file_t file("film");

  {
    progressive_t buffer(file.path, 4, 3, false);
    buffer.add(2, 2, Imath::Color3f(3.0f), 3);
    buffer.complete_pass(3);
    buffer.flush();
  }

  progressive_t buffer(file.path, 4, 3, true);
  EXPECT_TRUE(buffer.is_resumed());
  EXPECT_EQ(buffer.passes(), 1u);
  EXPECT_EQ(buffer.samples_per_pixel(), 3u);
  EXPECT_EQ(buffer.samples(2, 2), 3u);
  EXPECT_EQ(buffer.resolve(2, 2), Imath::Color3f(1.0f));
}

TEST(Progressive, ResumeWithoutFileCreatesOne) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 4, 3, true);
  EXPECT_FALSE(buffer.is_resumed());
  EXPECT_EQ(buffer.samples_per_pixel(), 0u);
}

TEST(Progressive, FreshRenderDiscardsOldSamples) {
  test::temp_file_t file("film");

  {
    progressive_t buffer(file.path, 4, 3, false);
    buffer.add(0, 0, Imath::Color3f(1.0f), 1);
    buffer.complete_pass(1);
  }

  progressive_t buffer(file.path, 4, 3, false);
  EXPECT_EQ(buffer.passes(), 0u);
  EXPECT_EQ(buffer.samples(0, 0), 0u);
}

TEST(Progressive, ResumeSizeMismatch) {
  test::temp_file_t file("film");

  { progressive_t buffer(file.path, 4, 3, false); }

  EXPECT_THROW(progressive_t(file.path, 3, 4, true), std::runtime_error);
}

TEST(Progressive, RejectsEmptySize) {
  test::temp_file_t file("film");
  EXPECT_THROW(progressive_t(file.path, 0, 4, false), std::runtime_error);
}

TEST(Progressive, RejectsCorruptFiles) {
  test::temp_file_t file("film");

  file.write("not a buffer");
  EXPECT_THROW(progressive_t(file.path, 4, 4, true), std::runtime_error);
  EXPECT_THROW(progressive_t::open_preview(file.path), std::runtime_error);

  // a valid header, with the pixel data cut off
  {
    progressive_t buffer(file.path, 4, 4, false);
  }
  ASSERT_EQ(truncate(file.path.c_str(), sizeof(film::header_t) + 10), 0);
  EXPECT_THROW(progressive_t(file.path, 4, 4, true), std::runtime_error);

  // wrong magic
  std::string junk(sizeof(film::header_t) + 16 * sizeof(film::pixel_t), '\0');
  memcpy(&junk[0], "NOTAFILM", 8);
  file.write(junk);
  EXPECT_THROW(progressive_t::open_preview(file.path), std::runtime_error);
}

TEST(Progressive, PreviewOfMissingFile) {
  test::temp_file_t file("film");
  EXPECT_THROW(progressive_t::open_preview(file.path), std::runtime_error);
}

TEST(Progressive, PreviewIsReadOnly) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 4, 4, false);
  buffer.add(3, 3, Imath::Color3f(2.0f), 1);
  buffer.complete_pass(1);

  const auto preview = progressive_t::open_preview(file.path);
  EXPECT_TRUE(preview->is_read_only());
  EXPECT_EQ(preview->width, 4u);
  EXPECT_EQ(preview->height, 4u);
  EXPECT_EQ(preview->passes(), 1u);

  // the mapping is shared, so the preview sees new samples
  EXPECT_EQ(preview->resolve(3, 3), Imath::Color3f(2.0f));
  buffer.add(3, 3, Imath::Color3f(0.0f), 1);
  EXPECT_EQ(preview->resolve(3, 3), Imath::Color3f(1.0f));

  allocator_t allocator(1 << 12);
  render_buffer_t tile;
  tile.allocate(allocator, 1, 1);
  tile.add(0, 0, Imath::Color3f(1.0f));
  EXPECT_THROW(preview->add_tile(Imath::V2i(0, 0), Imath::V2i(1, 1), tile), std::runtime_error);
}

TEST(Progressive, ConcurrentPreviewSeesWholeSamples) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 2, 2, false);
  const auto preview = progressive_t::open_preview(file.path);

  std::atomic<bool> done(false);

  // every sample is 1, so every consistent snapshot resolves to exactly 1
  std::thread writer([&]() {
    for (auto i=0; i<200000; ++i) {
      buffer.add(1, 1, Imath::Color3f(1.0f), 1);
    }
    done = true;
  });

  uint32_t last = 0;
  while (!done) {
    Imath::Color3f sum;
    uint32_t count;
    if (!preview->read(1, 1, sum, count)) {
      continue;
    }

    EXPECT_GE(count, last);
    last = count;

    if (count > 0) {
      EXPECT_EQ(sum, Imath::Color3f((float) count));
    }
  }

  writer.join();
  EXPECT_EQ(preview->samples(1, 1), 200000u);
}

TEST(Progressive, CompletePass) {
  test::temp_file_t file("film");

  progressive_t buffer(file.path, 2, 2, false);
  buffer.complete_pass(4);
  buffer.complete_pass(8);

  EXPECT_EQ(buffer.passes(), 2u);
  EXPECT_EQ(buffer.samples_per_pixel(), 8u);
}

TEST(File, WritesResolvedImage) {
  test::temp_file_t buffer_file("film");
  test::temp_file_t image_file("image.exr");

  progressive_t buffer(buffer_file.path, 2, 1, false);
  buffer.add(0, 0, Imath::Color3f(1.0f, 2.0f, 4.0f), 2);
  buffer.add(1, 0, Imath::Color3f(0.25f), 1);

  film::file_t image(2, 1, image_file.path);
  image.resolve(buffer);
  image.finalize();

  auto in = OIIO::ImageInput::open(image_file.path);
  ASSERT_TRUE(in);
  ASSERT_EQ(in->spec().width, 2);
  ASSERT_EQ(in->spec().height, 1);
  ASSERT_EQ(in->spec().nchannels, 3);

  std::vector<float> pixels(6);
  ASSERT_TRUE(in->read_image(OIIO::TypeDesc::FLOAT, pixels.data()));
  in->close();

  // linear values, without gamma
  EXPECT_FLOAT_EQ(pixels[0], 0.5f);
  EXPECT_FLOAT_EQ(pixels[1], 1.0f);
  EXPECT_FLOAT_EQ(pixels[2], 2.0f);
  EXPECT_FLOAT_EQ(pixels[3], 0.25f);
}

TEST(File, SizeMismatch) {
  test::temp_file_t buffer_file("film");
  test::temp_file_t image_file("image.png");

  progressive_t buffer(buffer_file.path, 2, 2, false);
  film::file_t image(4, 4, image_file.path);
  EXPECT_THROW(image.resolve(buffer), std::runtime_error);
}

TEST(File, HdrFormats) {
  EXPECT_TRUE(film::file_t::is_hdr("out.exr"));
  EXPECT_TRUE(film::file_t::is_hdr("some/dir/out.hdr"));
  EXPECT_FALSE(film::file_t::is_hdr("out.png"));
  EXPECT_FALSE(film::file_t::is_hdr("out"));
}

TEST(Progressive, RestartKeepsPreviewsMapped) {
  test::temp_file_t file("film");

  {
    progressive_t buffer(file.path, 4, 4, false);
    buffer.add(2, 1, Imath::Color3f(3.0f), 3);
    buffer.complete_pass(3);
  }

  const auto preview = progressive_t::open_preview(file.path);

  // a fresh render replaces the file, the old mapping stays readable
  // and keeps the old samples
  progressive_t buffer(file.path, 2, 2, false);
  EXPECT_EQ(buffer.samples(1, 1), 0u);
  EXPECT_EQ(buffer.passes(), 0u);

  EXPECT_EQ(preview->samples(2, 1), 3u);
  EXPECT_EQ(preview->resolve(2, 1), Imath::Color3f(1.0f));
  EXPECT_EQ(preview->samples(3, 3), 0u);
  EXPECT_EQ(preview->samples_per_pixel(), 3u);

  const auto current = progressive_t::open_preview(file.path);
  EXPECT_EQ(current->width, 2u);
  EXPECT_EQ(current->height, 2u);
}
