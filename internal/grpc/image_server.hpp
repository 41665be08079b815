#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "epd/server/v1.hpp"
#include "internal/service/image_service.hpp"

namespace epd::grpc {

class ImageServer final : public epd::server::v1::EpdImageService::Service {
public:
  explicit ImageServer(std::shared_ptr<epd::service::ImageService> svc);

  ::grpc::Status ListDevices(::grpc::ServerContext* ctx,
                             const epd::server::v1::ListDevicesRequest* req,
                             epd::server::v1::ListDevicesResponse* resp) override;

  ::grpc::Status GetAsset(::grpc::ServerContext* ctx,
                          const epd::server::v1::GetAssetRequest* req,
                          ::grpc::ServerWriter<epd::server::v1::AssetChunk>* writer) override;

  ::grpc::Status DeleteDevice(::grpc::ServerContext* ctx,
                              const epd::server::v1::DeleteDeviceRequest* req,
                              google::protobuf::Empty* resp) override;

  ::grpc::Status SubmitVector(::grpc::ServerContext* ctx,
                              const epd::server::v1::SubmitVectorRequest* req,
                              epd::server::v1::SubmitVectorResponse* resp) override;

  ::grpc::Status GetDisplay(::grpc::ServerContext* ctx,
                            const epd::server::v1::GetDisplayRequest* req,
                            epd::server::v1::GetDisplayResponse* resp) override;

private:
  std::shared_ptr<epd::service::ImageService> service_;
};

}
