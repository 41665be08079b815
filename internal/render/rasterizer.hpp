#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace epd::render {

/*
  Rasterizer output.

  Premultiplied ARGB32 in native byte order (cairo's image format),
  row-major, `stride` bytes per row.
*/
struct PixelBuffer {
  std::uint32_t                  width  = 0;
  std::uint32_t                  height = 0;
  std::int32_t                   stride = 0;
  std::shared_ptr<arrow::Buffer> pixels;
};

/*
  Vector-to-raster capability.

  The store treats this as a black box. Implementations must render at
  exactly width x height with no fitting transform beyond the document's
  own viewBox.
*/
class Rasterizer {
 public:
  virtual ~Rasterizer() = default;

  // ------------------------------------------------------------------
  // Rasterize
  // ------------------------------------------------------------------
  /*
    Parse and render a complete SVG document onto a transparent canvas.

    Throws:
      InvalidVectorInput  markup the library rejects
      StoreUnavailable    allocation or library failure
  */
  virtual PixelBuffer Rasterize(std::string_view document, std::uint32_t width, std::uint32_t height) = 0;

  // ------------------------------------------------------------------
  // EncodePng
  // ------------------------------------------------------------------
  /*
    Compressed preview encoding of a buffer produced by Rasterize().
    Throws StoreUnavailable on encoder failure.
  */
  virtual std::shared_ptr<arrow::Buffer> EncodePng(const PixelBuffer& buffer) = 0;
};

using RasterizerPtr = std::shared_ptr<Rasterizer>;

} // namespace epd::render
