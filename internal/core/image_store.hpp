#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "internal/model/asset_kind.hpp"
#include "internal/model/display_geometry.hpp"
#include "internal/render/rasterizer.hpp"
#include "internal/storage/asset_stream.hpp"
#include "internal/util/device_address.hpp"

namespace epd::core {

struct RenderResult {
  model::DisplayGeometry geometry;
  std::uint64_t          preview_size_bytes = 0;
  std::uint64_t          vector_size_bytes  = 0;
};

/*
  Device-keyed image store.

  Stateless facade over one directory:

      <root>/<mac>.svg   wrapped vector source
      <root>/<mac>.bmp   legacy raster, read/delete only
      <root>/<mac>.png   preview; its presence lists the device

  Every call touches the filesystem; nothing is cached. Calls for the same
  device are not serialized here, and multi-file writes and deletes are
  sequential best effort with no rollback.
*/
class ImageStore {
 public:
  ImageStore(model::StoreOptions options, render::RasterizerPtr rasterizer);

  /*
    Devices that have a preview image, unordered.
    Throws StoreUnavailable if the directory cannot be opened.
  */
  std::vector<util::DeviceAddress> ListDevices() const;

  /*
    Open one asset for streaming.
    Throws AssetNotFound if it is missing or unreadable.
  */
  storage::AssetStream ReadAsset(const util::DeviceAddress& address, model::AssetKind kind) const;

  /*
    Remove svg, bmp and png for the device. Only regular files are
    removed. Succeeds if at least one of them was removed; throws
    AssetNotFound if none was.
  */
  void DeleteDevice(const util::DeviceAddress& address) const;

  /*
    Wrap, rasterize and persist a vector body. Writes the preview first,
    then the vector source.

    Throws:
      InvalidVectorInput  before any file is touched
      StoreUnavailable    rasterizer or write failure; files already
                          written stay in place
  */
  RenderResult RenderAndStore(const util::DeviceAddress& address, std::string_view body);

  const model::StoreOptions& options() const {
    return options_;
  }

 private:
  void WriteAsset(const util::DeviceAddress& address, model::AssetKind kind, const uint8_t* data, int64_t size) const;

  model::StoreOptions   options_;
  render::RasterizerPtr rasterizer_;
};

} // namespace epd::core
