#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace epd::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace epd::util;

  if (dynamic_cast<const InvalidAddress*>(&e) || dynamic_cast<const InvalidVectorInput*>(&e) ||
      dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const AssetNotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  // Unclassified failures may carry library detail; keep it in the log.
  return {::grpc::StatusCode::INTERNAL, "internal error"};
}

} // namespace epd::grpc
