#include <cairo.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "internal/core/image_store.hpp"
#include "internal/render/rsvg_rasterizer.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using epd::core::ImageStore;
using epd::util::DeviceAddress;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "epd_render_store_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

ImageStore MakeStore(const fs::path& root, std::uint32_t width, std::uint32_t height) {
  epd::model::StoreOptions options;
  options.root     = root;
  options.geometry = {width, height};
  return ImageStore(options, std::make_shared<epd::render::RsvgRasterizer>());
}

void TestPortraitCircleScenario() {
  const auto dir   = FreshDir("portrait_circle");
  auto       store = MakeStore(dir, 128, 296);

  const auto address = DeviceAddress::Parse("0011223344556677");
  const auto result  = store.RenderAndStore(address, "<circle cx=\"125\" cy=\"125\" r=\"75\" />");
  assert(result.geometry.width == 128);
  assert(result.geometry.height == 296);

  const auto svg = ReadFile(dir / "0011223344556677.svg");
  assert(svg.rfind("<svg", 0) == 0);
  assert(svg.find("viewBox=\"0 0 128 296\"") != std::string::npos);

  const auto       png_path = (dir / "0011223344556677.png").string();
  cairo_surface_t* decoded  = cairo_image_surface_create_from_png(png_path.c_str());
  assert(cairo_surface_status(decoded) == CAIRO_STATUS_SUCCESS);
  assert(cairo_image_surface_get_width(decoded) == 128);
  assert(cairo_image_surface_get_height(decoded) == 296);
  assert(static_cast<std::uint64_t>(fs::file_size(png_path)) == result.preview_size_bytes);
  cairo_surface_destroy(decoded);

  const auto devices = store.ListDevices();
  assert(devices.size() == 1);
  assert(devices[0] == address);

  auto        stream = store.ReadAsset(address, epd::model::AssetKind::kPreviewImage);
  std::string streamed;
  for (auto chunk = stream.Read(4096); chunk->size() > 0; chunk = stream.Read(4096)) {
    streamed.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(chunk->size()));
  }
  assert(!streamed.empty());
  assert(streamed == ReadFile(png_path));
}

void TestAbsentDeviceIsNotFoundAndNotListed() {
  const auto dir   = FreshDir("absent");
  auto       store = MakeStore(dir, 128, 296);

  (void)store.RenderAndStore(DeviceAddress::Parse("0011223344556677"), "<rect width=\"5\" height=\"5\"/>");

  const auto absent = DeviceAddress::Parse("AABBCCDDEEFFAABB");
  bool       threw  = false;
  try {
    (void)store.ReadAsset(absent, epd::model::AssetKind::kPreviewImage);
  } catch (const epd::util::AssetNotFound&) {
    threw = true;
  }
  assert(threw);

  for (const auto& device : store.ListDevices()) {
    assert(device != absent);
  }
}

void TestTextBodyRenders() {
  const auto dir   = FreshDir("text_body");
  auto       store = MakeStore(dir, 296, 128);

  (void)store.RenderAndStore(DeviceAddress::Parse("AABBCCDDEEFFAABB"),
                             "<text x=\"10\" y=\"40\" font-family=\"sans-serif\" font-size=\"24\">Room 4.12</text>");
  assert(fs::exists(dir / "aabbccddeeffaabb.png"));
  assert(fs::exists(dir / "aabbccddeeffaabb.svg"));
}

void TestMalformedBodyIsRejectedWithoutFiles() {
  const auto dir   = FreshDir("malformed");
  auto       store = MakeStore(dir, 128, 296);

  bool threw = false;
  try {
    (void)store.RenderAndStore(DeviceAddress::Parse("0011223344556677"), "<circle cx=\"1\"");
  } catch (const epd::util::InvalidVectorInput&) {
    threw = true;
  }
  assert(threw);
  assert(fs::is_empty(dir));
}

} // namespace

int main() {
  TestPortraitCircleScenario();
  TestAbsentDeviceIsNotFoundAndNotListed();
  TestTextBodyRenders();
  TestMalformedBodyIsRejectedWithoutFiles();

  std::cout << "epd_integration_render_store: pass\n";
  return 0;
}
