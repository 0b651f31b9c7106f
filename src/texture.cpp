#include "texture.hpp"

#include <OpenImageIO/imageio.h>

#include <cmath>
#include <stdexcept>

using namespace OIIO;

namespace {
  inline int64_t wrap(int64_t i, int64_t n) {
    const auto r = i % n;
    return r < 0 ? r + n : r;
  }

  inline float fract(float f) {
    return f - std::floor(f);
  }
}

texture_t::texture_t(
  uint32_t width
, uint32_t height
, const std::vector<Imath::Color3f>& texels
, filter_t filter)
  : width(width)
  , height(height)
  , filter(filter)
  , texels(texels)
{
  if (width == 0 || height == 0 || texels.size() != (size_t) width * height) {
    throw std::runtime_error("invalid texture dimensions");
  }
}

Imath::Color3f texture_t::texel(int64_t x, int64_t y) const {
  const auto i = wrap(x, width);
  const auto j = wrap(y, height);
  return texels[j * width + i];
}

Imath::Color3f texture_t::sample(const Imath::V2f& uv) const {
  if (texels.empty()) {
    return Imath::Color3f(0.0f);
  }

  if (!std::isfinite(uv.x) || !std::isfinite(uv.y)) {
    return texel(0, 0);
  }

  // continuous texel space, with texel centers at half integers
  const auto s = fract(uv.x) * width;
  const auto t = (1.0f - fract(uv.y)) * height;

  if (filter == filter_t::Nearest) {
    // rows count down from the top, v = 0 lands in the bottom row
    const auto row = (int64_t) height - 1 - (int64_t) std::floor(fract(uv.y) * height);
    return texel((int64_t) std::floor(s), row);
  }

  const auto x = s - 0.5f;
  const auto y = t - 0.5f;

  const auto x0 = (int64_t) std::floor(x);
  const auto y0 = (int64_t) std::floor(y);

  const auto fx = x - x0;
  const auto fy = y - y0;

  const auto top    = color::lerp(texel(x0, y0), texel(x0 + 1, y0), fx);
  const auto bottom = color::lerp(texel(x0, y0 + 1), texel(x0 + 1, y0 + 1), fx);

  return color::lerp(top, bottom, fy);
}

texture_t texture_t::load(const std::string& path, filter_t filter) {
  auto in = ImageInput::open(path);
  if (!in) {
    throw std::runtime_error("Failed to open texture " + path + ": " + OIIO::geterror());
  }

  const auto& spec = in->spec();
  if (spec.width <= 0 || spec.height <= 0 || spec.nchannels <= 0) {
    throw std::runtime_error("Texture has no pixels: " + path);
  }

  const auto channels = spec.nchannels;

  std::vector<float> pixels((size_t) spec.width * spec.height * channels);
  if (!in->read_image(0, 0, 0, channels, TypeDesc::FLOAT, pixels.data())) {
    throw std::runtime_error("Failed to read texture " + path + ": " + in->geterror());
  }
  in->close();

  std::vector<Imath::Color3f> texels((size_t) spec.width * spec.height);
  for (size_t i=0; i<texels.size(); ++i) {
    const auto p = &pixels[i * channels];
    // grey scale images get replicated into all channels
    if (channels < 3) {
      texels[i] = Imath::Color3f(p[0]);
    }
    else {
      texels[i] = Imath::Color3f(p[0], p[1], p[2]);
    }
  }

  return texture_t(spec.width, spec.height, texels, filter);
}
