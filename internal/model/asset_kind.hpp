#pragma once

#include <cstdint>
#include <string_view>

namespace epd::model {

enum class AssetKind : std::uint8_t {
  kVectorSource = 0,
  kRasterImage = 1,
  kPreviewImage = 2,
};

// Every kind, in the order deleteDevice removes them.
inline constexpr AssetKind kAllAssetKinds[] = {
    AssetKind::kVectorSource,
    AssetKind::kRasterImage,
    AssetKind::kPreviewImage,
};

// No default labels: -Wswitch flags any kind added without a case here.
// Out-of-range values fall back to the preview.
constexpr std::string_view Extension(AssetKind kind) {
  switch (kind) {
    case AssetKind::kVectorSource:
      return "svg";
    case AssetKind::kRasterImage:
      return "bmp";
    case AssetKind::kPreviewImage:
      return "png";
  }
  return "png";
}

constexpr std::string_view ContentType(AssetKind kind) {
  switch (kind) {
    case AssetKind::kVectorSource:
      return "image/svg+xml";
    case AssetKind::kRasterImage:
      return "image/bmp";
    case AssetKind::kPreviewImage:
      return "image/png";
  }
  return "image/png";
}

constexpr std::string_view ToString(AssetKind kind) {
  switch (kind) {
    case AssetKind::kVectorSource:
      return "vector";
    case AssetKind::kRasterImage:
      return "raster";
    case AssetKind::kPreviewImage:
      return "preview";
  }
  return "preview";
}

}  // namespace epd::model
