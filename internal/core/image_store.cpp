#include "image_store.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/render/svg_document.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace epd::core {

using epd::model::AssetKind;
using epd::observability::DeviceField;
using epd::observability::IntField;
using epd::observability::KindField;
using epd::observability::StringField;
using epd::storage::common::AssetPath;
using epd::util::DeviceAddress;

namespace fs = std::filesystem;

ImageStore::ImageStore(model::StoreOptions options, render::RasterizerPtr rasterizer)
    : options_(std::move(options)), rasterizer_(std::move(rasterizer)) {
  if (options_.root.empty()) {
    throw std::invalid_argument("image store root must not be empty");
  }
  if (options_.geometry.width == 0 || options_.geometry.height == 0) {
    throw std::invalid_argument("display geometry must be non-zero");
  }
  if (!rasterizer_) {
    throw std::invalid_argument("image store requires a rasterizer");
  }
}

std::vector<DeviceAddress> ImageStore::ListDevices() const {
  std::error_code         ec;
  fs::directory_iterator it(options_.root, ec);
  if (ec) {
    EPD_LOG_ERROR("image directory unavailable", {StringField("error", ec.message())});
    throw util::StoreUnavailable("list devices: image directory cannot be opened");
  }

  const fs::path             preview_extension = "." + std::string(model::Extension(AssetKind::kPreviewImage));
  std::vector<DeviceAddress> devices;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;

    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    if (entry.path().extension() != preview_extension) {
      continue;
    }

    try {
      devices.push_back(DeviceAddress::Parse(entry.path().stem().string()));
    } catch (const util::InvalidAddress&) {
      EPD_LOG_DEBUG("skipping preview with undecodable name", {StringField("name", entry.path().filename().string())});
    }
  }

  // A failed increment ends the scan early; what was collected still stands.
  if (ec) {
    EPD_LOG_WARN("image directory scan stopped early", {StringField("error", ec.message())});
  }

  return devices;
}

storage::AssetStream ImageStore::ReadAsset(const DeviceAddress& address, AssetKind kind) const {
  const auto path = AssetPath(options_.root, address, kind);

  auto file = arrow::io::ReadableFile::Open(path.string());
  if (!file.ok()) {
    EPD_LOG_DEBUG("asset open failed", {DeviceField(address), KindField(kind),
                                        StringField("error", file.status().message())});
    throw util::AssetNotFound("no " + std::string(model::ToString(kind)) + " image for device " + address.ToString());
  }

  return storage::AssetStream(std::move(file).ValueOrDie(), address, kind);
}

void ImageStore::DeleteDevice(const DeviceAddress& address) const {
  int removed = 0;

  // Sequential and independent: one failure does not stop the others and
  // nothing is restored.
  for (const auto kind : model::kAllAssetKinds) {
    const auto path = AssetPath(options_.root, address, kind);

    // Only regular files count; a directory squatting on the name is left alone.
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      continue;
    }
    if (fs::remove(path, ec)) {
      ++removed;
      continue;
    }
    if (ec) {
      EPD_LOG_WARN("asset removal failed", {DeviceField(address), KindField(kind),
                                            StringField("error", ec.message())});
    }
  }

  if (removed == 0) {
    throw util::AssetNotFound("could not find any images for device " + address.ToString());
  }

  EPD_LOG_INFO("device images deleted", {DeviceField(address), IntField("removed", removed)});
}

RenderResult ImageStore::RenderAndStore(const DeviceAddress& address, std::string_view body) {
  const auto& geometry = options_.geometry;
  const auto  device   = address.ToString();
  const auto  document = render::WrapVectorBody(body, geometry);

  render::PixelBuffer            pixels;
  std::shared_ptr<arrow::Buffer> preview;
  try {
    pixels  = rasterizer_->Rasterize(document, geometry.width, geometry.height);
    preview = rasterizer_->EncodePng(pixels);
  } catch (const util::InvalidVectorInput& e) {
    EPD_LOG_WARN("vector input rejected", {DeviceField(address), StringField("error", e.what())});
    throw util::InvalidVectorInput("render for device " + device + ": " + e.what());
  } catch (const util::StoreUnavailable& e) {
    EPD_LOG_ERROR("rasterizer failure", {DeviceField(address), StringField("error", e.what())});
    throw util::StoreUnavailable("render for device " + device + " failed");
  }

  if (pixels.width != geometry.width || pixels.height != geometry.height) {
    throw util::StoreUnavailable("render for device " + device + ": rasterizer returned " + std::to_string(pixels.width) + "x" +
                                 std::to_string(pixels.height) + ", expected " + std::to_string(geometry.width) + "x" +
                                 std::to_string(geometry.height));
  }

  WriteAsset(address, AssetKind::kPreviewImage, preview->data(), preview->size());
  WriteAsset(address, AssetKind::kVectorSource, reinterpret_cast<const uint8_t*>(document.data()), static_cast<int64_t>(document.size()));

  EPD_LOG_INFO("device image stored", {DeviceField(address), IntField("preview_bytes", preview->size()),
                                       IntField("vector_bytes", static_cast<int64_t>(document.size()))});

  RenderResult result;
  result.geometry           = geometry;
  result.preview_size_bytes = static_cast<std::uint64_t>(preview->size());
  result.vector_size_bytes  = document.size();
  return result;
}

void ImageStore::WriteAsset(const DeviceAddress& address, AssetKind kind, const uint8_t* data, int64_t size) const {
  const auto path   = AssetPath(options_.root, address, kind);
  const auto status = storage::common::OverwriteFile(path.string(), data, size);
  if (!status.ok()) {
    EPD_LOG_ERROR("asset write failed", {DeviceField(address), KindField(kind),
                                         StringField("error", status.message())});
    throw util::StoreUnavailable("write " + std::string(model::ToString(kind)) + " image for device " + address.ToString() + " failed");
  }
}

} // namespace epd::core
