#include "internal/render/rsvg_rasterizer.hpp"
#include "internal/render/svg_document.hpp"
#include "internal/util/errors.hpp"

#include <cairo.h>

#include <cassert>
#include <cstring>
#include <iostream>
#include <string>

namespace {

using epd::model::DisplayGeometry;
using epd::render::PixelBuffer;
using epd::render::RsvgRasterizer;
using epd::render::WrapVectorBody;
using epd::util::InvalidVectorInput;

std::uint32_t PixelAt(const PixelBuffer& buffer, std::uint32_t x, std::uint32_t y) {
  std::uint32_t pixel = 0;
  std::memcpy(&pixel, buffer.pixels->data() + static_cast<std::size_t>(y) * buffer.stride + x * 4, sizeof(pixel));
  return pixel;
}

struct PngReader {
  const std::uint8_t* data;
  std::size_t         size;
  std::size_t         offset = 0;
};

cairo_status_t ReadFromBuffer(void* closure, unsigned char* data, unsigned int length) {
  auto* reader = static_cast<PngReader*>(closure);
  if (reader->offset + length > reader->size) {
    return CAIRO_STATUS_READ_ERROR;
  }
  std::memcpy(data, reader->data + reader->offset, length);
  reader->offset += length;
  return CAIRO_STATUS_SUCCESS;
}

RsvgRasterizer MakeRasterizer() {
  RsvgRasterizer::Options options;
  options.load_system_fonts = false;
  return RsvgRasterizer(options);
}

void TestRasterizeMatchesTargetSize() {
  auto       rasterizer = MakeRasterizer();
  const auto doc        = WrapVectorBody("<rect width=\"10\" height=\"10\" fill=\"black\"/>", DisplayGeometry{128, 296});
  const auto pixels     = rasterizer.Rasterize(doc, 128, 296);

  assert(pixels.width == 128);
  assert(pixels.height == 296);
  assert(pixels.stride >= 128 * 4);
  assert(pixels.pixels->size() >= static_cast<int64_t>(pixels.stride) * 296);
}

void TestCanvasStartsTransparent() {
  auto       rasterizer = MakeRasterizer();
  const auto doc        = WrapVectorBody("<rect x=\"0\" y=\"0\" width=\"4\" height=\"4\" fill=\"#000000\"/>", DisplayGeometry{16, 16});
  const auto pixels     = rasterizer.Rasterize(doc, 16, 16);

  // Opaque black, premultiplied ARGB32.
  assert(PixelAt(pixels, 1, 1) == 0xFF000000u);
  assert(PixelAt(pixels, 12, 12) == 0x00000000u);
}

void TestCircleLandsWhereDrawn() {
  auto       rasterizer = MakeRasterizer();
  const auto doc = WrapVectorBody("<circle cx=\"64\" cy=\"148\" r=\"40\" fill=\"black\"/>", DisplayGeometry{128, 296});
  const auto pixels = rasterizer.Rasterize(doc, 128, 296);

  assert((PixelAt(pixels, 64, 148) >> 24) == 0xFF);
  assert((PixelAt(pixels, 2, 2) >> 24) == 0x00);
  assert((PixelAt(pixels, 64, 20) >> 24) == 0x00);
}

void TestMalformedMarkupIsInvalidInput() {
  auto rasterizer = MakeRasterizer();

  bool threw = false;
  try {
    (void)rasterizer.Rasterize("<svg xmlns=\"http://www.w3.org/2000/svg\"><circle", 16, 16);
  } catch (const InvalidVectorInput&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)rasterizer.Rasterize("this is not markup", 16, 16);
  } catch (const InvalidVectorInput&) {
    threw = true;
  }
  assert(threw);
}

void TestEncodePngDecodesToSameSize() {
  auto       rasterizer = MakeRasterizer();
  const auto doc        = WrapVectorBody("<circle cx=\"64\" cy=\"148\" r=\"40\"/>", DisplayGeometry{128, 296});
  const auto pixels     = rasterizer.Rasterize(doc, 128, 296);
  const auto png        = rasterizer.EncodePng(pixels);

  static const unsigned char kSignature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  assert(png->size() > static_cast<int64_t>(sizeof(kSignature)));
  assert(std::memcmp(png->data(), kSignature, sizeof(kSignature)) == 0);

  PngReader        reader{png->data(), static_cast<std::size_t>(png->size())};
  cairo_surface_t* decoded = cairo_image_surface_create_from_png_stream(&ReadFromBuffer, &reader);
  assert(cairo_surface_status(decoded) == CAIRO_STATUS_SUCCESS);
  assert(cairo_image_surface_get_width(decoded) == 128);
  assert(cairo_image_surface_get_height(decoded) == 296);
  cairo_surface_destroy(decoded);
}

void TestSystemFontsCanBeLoaded() {
  RsvgRasterizer rasterizer;
  const auto     doc = WrapVectorBody("<text x=\"2\" y=\"12\" font-size=\"10\">EPD</text>", DisplayGeometry{64, 16});
  const auto     pixels = rasterizer.Rasterize(doc, 64, 16);
  assert(pixels.width == 64);
  assert(pixels.height == 16);
}

} // namespace

int main() {
  TestRasterizeMatchesTargetSize();
  TestCanvasStartsTransparent();
  TestCircleLandsWhereDrawn();
  TestMalformedMarkupIsInvalidInput();
  TestEncodePngDecodesToSameSize();
  TestSystemFontsCanBeLoaded();

  std::cout << "epd_unit_rsvg_rasterizer: pass\n";
  return 0;
}
