#include "asset_stream.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace epd::storage {

using epd::observability::DeviceField;
using epd::observability::KindField;
using epd::observability::StringField;

AssetStream::AssetStream(std::shared_ptr<arrow::io::ReadableFile> file, util::DeviceAddress address, model::AssetKind kind)
    : file_(std::move(file)), address_(address), kind_(kind) {
}

AssetStream::~AssetStream() {
  Close();
}

AssetStream::AssetStream(AssetStream&& other) noexcept
    : file_(std::move(other.file_)), address_(other.address_), kind_(other.kind_), bytes_read_(other.bytes_read_) {
  other.file_ = nullptr;
}

AssetStream& AssetStream::operator=(AssetStream&& other) noexcept {
  if (this != &other) {
    Close();
    file_       = std::move(other.file_);
    address_    = other.address_;
    kind_       = other.kind_;
    bytes_read_ = other.bytes_read_;
    other.file_ = nullptr;
  }
  return *this;
}

std::shared_ptr<arrow::Buffer> AssetStream::Read(int64_t max_bytes) {
  if (!file_) {
    return std::make_shared<arrow::Buffer>(nullptr, 0);
  }

  auto chunk = file_->Read(max_bytes);
  if (!chunk.ok()) {
    EPD_LOG_ERROR("asset read failed", {DeviceField(address_), KindField(kind_),
                                        StringField("error", chunk.status().ToString())});
    Close();
    throw util::StoreUnavailable("read " + std::string(model::ToString(kind_)) + " asset for device " + address_.ToString() + " failed");
  }

  auto buffer = std::move(chunk).ValueOrDie();
  if (buffer->size() == 0) {
    Close();
  }
  bytes_read_ += buffer->size();
  return buffer;
}

void AssetStream::Close() {
  if (!file_) {
    return;
  }
  auto status = file_->Close();
  if (!status.ok()) {
    EPD_LOG_WARN("asset close failed", {DeviceField(address_), StringField("error", status.ToString())});
  }
  file_ = nullptr;
}

} // namespace epd::storage
