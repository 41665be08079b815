#include "rsvg_rasterizer.hpp"

#include <cairo.h>
#include <fontconfig/fontconfig.h>
#include <librsvg/rsvg.h>

#include <cstring>
#include <memory>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epd::render {

using epd::observability::IntField;
using epd::observability::StringField;

namespace {

struct GObjectDeleter {
  void operator()(gpointer object) const {
    if (object) g_object_unref(object);
  }
};

struct GErrorDeleter {
  void operator()(GError* error) const {
    if (error) g_error_free(error);
  }
};

struct SurfaceDeleter {
  void operator()(cairo_surface_t* surface) const {
    cairo_surface_destroy(surface);
  }
};

struct ContextDeleter {
  void operator()(cairo_t* cr) const {
    cairo_destroy(cr);
  }
};

using HandlePtr  = std::unique_ptr<RsvgHandle, GObjectDeleter>;
using ErrorPtr   = std::unique_ptr<GError, GErrorDeleter>;
using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDeleter>;
using ContextPtr = std::unique_ptr<cairo_t, ContextDeleter>;

std::string ErrorMessage(const ErrorPtr& error) {
  return error && error->message ? std::string(error->message) : std::string("unknown error");
}

cairo_status_t AppendToString(void* closure, const unsigned char* data, unsigned int length) {
  static_cast<std::string*>(closure)->append(reinterpret_cast<const char*>(data), length);
  return CAIRO_STATUS_SUCCESS;
}

// Wraps existing pixel memory; the surface never owns it.
SurfacePtr WrapPixels(unsigned char* data, std::uint32_t width, std::uint32_t height, std::int32_t stride) {
  SurfacePtr surface(cairo_image_surface_create_for_data(data, CAIRO_FORMAT_ARGB32, static_cast<int>(width), static_cast<int>(height), stride));
  const auto status = cairo_surface_status(surface.get());
  if (status != CAIRO_STATUS_SUCCESS) {
    throw util::StoreUnavailable(std::string("raster surface unavailable: ") + cairo_status_to_string(status));
  }
  return surface;
}

void LoadSystemFonts() {
  if (!FcInit()) {
    EPD_LOG_WARN("fontconfig initialisation failed, text falls back to built-in fonts");
    return;
  }

  FcFontSet* fonts = FcConfigGetFonts(FcConfigGetCurrent(), FcSetSystem);
  EPD_LOG_INFO("system fonts discovered", {IntField("count", fonts ? fonts->nfont : 0)});
}

} // namespace

RsvgRasterizer::RsvgRasterizer() : RsvgRasterizer(Options{}) {
}

RsvgRasterizer::RsvgRasterizer(Options options) {
  if (options.load_system_fonts) {
    LoadSystemFonts();
  }
}

PixelBuffer RsvgRasterizer::Rasterize(std::string_view document, std::uint32_t width, std::uint32_t height) {
  if (width == 0 || height == 0) {
    throw util::StoreUnavailable("rasterize: target size must be non-zero");
  }

  GError*   raw_error = nullptr;
  HandlePtr handle(rsvg_handle_new_from_data(reinterpret_cast<const guint8*>(document.data()), document.size(), &raw_error));
  ErrorPtr  parse_error(raw_error);
  if (!handle) {
    throw util::InvalidVectorInput("vector document rejected: " + ErrorMessage(parse_error));
  }

  PixelBuffer buffer;
  buffer.width  = width;
  buffer.height = height;
  buffer.stride = cairo_format_stride_for_width(CAIRO_FORMAT_ARGB32, static_cast<int>(width));
  if (buffer.stride <= 0) {
    throw util::StoreUnavailable("rasterize: width " + std::to_string(width) + " is not representable");
  }

  const int64_t size_bytes = static_cast<int64_t>(buffer.stride) * height;
  auto          allocated  = arrow::AllocateBuffer(size_bytes);
  if (!allocated.ok()) {
    throw util::StoreUnavailable("rasterize: pixel buffer allocation failed: " + allocated.status().ToString());
  }
  buffer.pixels = std::shared_ptr<arrow::Buffer>(std::move(allocated).ValueOrDie());
  std::memset(buffer.pixels->mutable_data(), 0, static_cast<size_t>(size_bytes));

  auto       surface = WrapPixels(buffer.pixels->mutable_data(), width, height, buffer.stride);
  ContextPtr cr(cairo_create(surface.get()));

  // The document's viewBox already matches the target size, so this is
  // a 1:1 mapping.
  RsvgRectangle viewport{0.0, 0.0, static_cast<double>(width), static_cast<double>(height)};
  raw_error = nullptr;
  const bool rendered = rsvg_handle_render_document(handle.get(), cr.get(), &viewport, &raw_error);
  ErrorPtr   render_error(raw_error);
  if (!rendered) {
    throw util::InvalidVectorInput("vector document could not be rendered: " + ErrorMessage(render_error));
  }

  const auto cairo_state = cairo_status(cr.get());
  if (cairo_state != CAIRO_STATUS_SUCCESS) {
    throw util::StoreUnavailable(std::string("rasterize: cairo failure: ") + cairo_status_to_string(cairo_state));
  }
  cairo_surface_flush(surface.get());

  EPD_LOG_DEBUG("document rasterized", {IntField("width", width), IntField("height", height), IntField("document_bytes", document.size())});
  return buffer;
}

std::shared_ptr<arrow::Buffer> RsvgRasterizer::EncodePng(const PixelBuffer& buffer) {
  if (!buffer.pixels || buffer.pixels->size() < static_cast<int64_t>(buffer.stride) * buffer.height) {
    throw util::StoreUnavailable("png encode: pixel buffer is smaller than its declared size");
  }

  // cairo only reads from the surface while encoding.
  auto surface = WrapPixels(const_cast<unsigned char*>(buffer.pixels->data()), buffer.width, buffer.height, buffer.stride);

  std::string encoded;
  const auto  status = cairo_surface_write_to_png_stream(surface.get(), &AppendToString, &encoded);
  if (status != CAIRO_STATUS_SUCCESS) {
    EPD_LOG_ERROR("png encode failed", {StringField("error", cairo_status_to_string(status))});
    throw util::StoreUnavailable(std::string("png encode failed: ") + cairo_status_to_string(status));
  }
  return arrow::Buffer::FromString(std::move(encoded));
}

} // namespace epd::render
