#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "epd/server/v1.hpp"

namespace epd::client {

/*
  Thin synchronous client for EpdImageService.

  gRPC failures come back as arrow::Status:
    INVALID_ARGUMENT  -> Invalid
    NOT_FOUND         -> KeyError
    anything else     -> IOError
*/
class EpdClient {
 public:
  struct Asset {
    std::string                    content_type;
    std::shared_ptr<arrow::Buffer> data;
  };

  explicit EpdClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<std::vector<std::string>> ListDevices() const;

  // Drains the server stream into one contiguous buffer.
  arrow::Result<Asset> FetchAsset(const std::string& address, epd::server::v1::AssetKind kind,
                                  uint32_t chunk_size_bytes = 0) const;

  arrow::Status DeleteDevice(const std::string& address) const;

  arrow::Result<epd::server::v1::SubmitVectorResponse> SubmitVector(const std::string& address,
                                                                    std::string_view   body) const;

  arrow::Result<epd::server::v1::DisplayGeometry> GetDisplay() const;

 private:
  std::unique_ptr<epd::server::v1::EpdImageService::Stub> stub_;
};

} // namespace epd::client
