#pragma once

#include <cstdint>
#include <functional>

#include "epd/server/v1.hpp"
#include "service_context.hpp"

namespace epd::service {

/*
  Request-level logic behind EpdImageService.

  Decodes address text, maps wire enums to store kinds, sorts listings and
  wraps every call in logging, a span and request metrics.
*/
class ImageService {
public:
  static constexpr std::uint32_t kDefaultChunkBytes = 64 * 1024;
  static constexpr std::uint32_t kMaxChunkBytes     = 1024 * 1024;

  // How a GetAsset transfer ended when nothing was thrown.
  enum class StreamOutcome {
    kCompleted,
    kCancelled,
    kClientGone,
  };

  // Returns false once the receiving side no longer accepts chunks.
  using ChunkWriter = std::function<bool(const epd::server::v1::AssetChunk&)>;
  using CancelCheck = std::function<bool()>;

  explicit ImageService(ServiceContext ctx);

  epd::server::v1::ListDevicesResponse
  ListDevices(const epd::server::v1::ListDevicesRequest& req);

  /*
    Opens the asset and hands it to write chunk by chunk. The first chunk
    carries the content type; an empty asset still yields one chunk.
    cancelled is polled before every read. Store errors raised mid-transfer
    count against the request like any other failure.
  */
  StreamOutcome StreamAsset(const epd::server::v1::GetAssetRequest& req,
                            const CancelCheck& cancelled,
                            const ChunkWriter& write);

  void DeleteDevice(const epd::server::v1::DeleteDeviceRequest& req);

  epd::server::v1::SubmitVectorResponse
  SubmitVector(const epd::server::v1::SubmitVectorRequest& req);

  epd::server::v1::GetDisplayResponse
  GetDisplay(const epd::server::v1::GetDisplayRequest& req);

  static std::uint32_t ResolveChunkSize(std::uint32_t requested);

private:
  ServiceContext ctx_;
};

}
