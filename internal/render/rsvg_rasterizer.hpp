#pragma once

#include "internal/render/rasterizer.hpp"

namespace epd::render {

/*
  Rasterizer backed by librsvg (parsing, rendering) and cairo (image
  surfaces, PNG encoding). Font lookup goes through fontconfig.
*/
class RsvgRasterizer final : public Rasterizer {
 public:
  struct Options {
    bool load_system_fonts = true;
  };

  RsvgRasterizer();
  explicit RsvgRasterizer(Options options);

  PixelBuffer Rasterize(std::string_view document, std::uint32_t width, std::uint32_t height) override;

  std::shared_ptr<arrow::Buffer> EncodePng(const PixelBuffer& buffer) override;
};

} // namespace epd::render
