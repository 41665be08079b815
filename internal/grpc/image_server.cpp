#include "image_server.hpp"
#include "grpc_error.hpp"

namespace epd::grpc {

ImageServer::ImageServer(std::shared_ptr<epd::service::ImageService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ImageServer::ListDevices(::grpc::ServerContext*,
                                        const epd::server::v1::ListDevicesRequest* req,
                                        epd::server::v1::ListDevicesResponse* resp) {
  try {
    *resp = service_->ListDevices(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

/*
  Streams the asset in chunks. A cancelled call stops at the next chunk
  boundary; the store's stream closes its file on every exit path.
*/
::grpc::Status ImageServer::GetAsset(::grpc::ServerContext* ctx,
                                     const epd::server::v1::GetAssetRequest* req,
                                     ::grpc::ServerWriter<epd::server::v1::AssetChunk>* writer) {
  using Outcome = epd::service::ImageService::StreamOutcome;
  try {
    const auto outcome = service_->StreamAsset(
        *req,
        [ctx] { return ctx != nullptr && ctx->IsCancelled(); },
        [writer](const epd::server::v1::AssetChunk& chunk) { return writer->Write(chunk); });

    switch (outcome) {
      case Outcome::kCompleted:
        return ::grpc::Status::OK;
      case Outcome::kCancelled:
        return {::grpc::StatusCode::CANCELLED, "asset stream cancelled"};
      case Outcome::kClientGone:
        return {::grpc::StatusCode::CANCELLED, "client went away"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImageServer::DeleteDevice(::grpc::ServerContext*,
                                         const epd::server::v1::DeleteDeviceRequest* req,
                                         google::protobuf::Empty*) {
  try {
    service_->DeleteDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImageServer::SubmitVector(::grpc::ServerContext*,
                                         const epd::server::v1::SubmitVectorRequest* req,
                                         epd::server::v1::SubmitVectorResponse* resp) {
  try {
    *resp = service_->SubmitVector(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImageServer::GetDisplay(::grpc::ServerContext*,
                                       const epd::server::v1::GetDisplayRequest* req,
                                       epd::server::v1::GetDisplayResponse* resp) {
  try {
    *resp = service_->GetDisplay(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
