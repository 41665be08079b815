#include "client/cpp/epd_client.h"

#include <memory>
#include <string>
#include <string_view>

#include <arrow/buffer_builder.h>
#include <arrow/status.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

namespace epd::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

} // namespace

EpdClient::EpdClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(epd::server::v1::EpdImageService::NewStub(channel)) {}

arrow::Result<std::vector<std::string>> EpdClient::ListDevices() const {
  epd::server::v1::ListDevicesRequest  request;
  epd::server::v1::ListDevicesResponse response;
  grpc::ClientContext                  ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListDevices(&ctx, request, &response), "ListDevices"));
  return std::vector<std::string>(response.addresses().begin(), response.addresses().end());
}

arrow::Result<EpdClient::Asset> EpdClient::FetchAsset(const std::string& address, epd::server::v1::AssetKind kind,
                                                      uint32_t chunk_size_bytes) const {
  epd::server::v1::GetAssetRequest request;
  request.set_address(address);
  request.set_kind(kind);
  request.set_chunk_size_bytes(chunk_size_bytes);

  grpc::ClientContext ctx;
  auto                reader = stub_->GetAsset(&ctx, request);

  Asset                       asset;
  arrow::BufferBuilder        builder;
  epd::server::v1::AssetChunk chunk;
  while (reader->Read(&chunk)) {
    if (!chunk.content_type().empty()) {
      asset.content_type = chunk.content_type();
    }
    ARROW_RETURN_NOT_OK(builder.Append(chunk.data().data(), static_cast<int64_t>(chunk.data().size())));
  }

  ARROW_RETURN_NOT_OK(GrpcToArrow(reader->Finish(), "GetAsset"));
  ARROW_ASSIGN_OR_RAISE(asset.data, builder.Finish());
  return asset;
}

arrow::Status EpdClient::DeleteDevice(const std::string& address) const {
  epd::server::v1::DeleteDeviceRequest request;
  request.set_address(address);

  google::protobuf::Empty response;
  grpc::ClientContext     ctx;

  return GrpcToArrow(stub_->DeleteDevice(&ctx, request, &response), "DeleteDevice");
}

arrow::Result<epd::server::v1::SubmitVectorResponse> EpdClient::SubmitVector(const std::string& address,
                                                                             std::string_view   body) const {
  epd::server::v1::SubmitVectorRequest request;
  request.set_address(address);
  request.set_body(std::string(body));

  epd::server::v1::SubmitVectorResponse response;
  grpc::ClientContext                   ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->SubmitVector(&ctx, request, &response), "SubmitVector"));
  return response;
}

arrow::Result<epd::server::v1::DisplayGeometry> EpdClient::GetDisplay() const {
  epd::server::v1::GetDisplayRequest  request;
  epd::server::v1::GetDisplayResponse response;
  grpc::ClientContext                 ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetDisplay(&ctx, request, &response), "GetDisplay"));
  return response.geometry();
}

} // namespace epd::client
