#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/model/asset_kind.hpp"
#include "internal/util/device_address.hpp"

namespace epd::storage {

/*
  Forward-only byte stream over one stored asset.

  Owns the open file handle. Contents are read on demand, never buffered
  whole. The handle is released by Close(), by reaching the end, or by
  destruction, whichever comes first, so a consumer that gives up early
  cannot leak it.
*/
class AssetStream {
 public:
  AssetStream(std::shared_ptr<arrow::io::ReadableFile> file, util::DeviceAddress address, model::AssetKind kind);
  ~AssetStream();

  AssetStream(const AssetStream&)            = delete;
  AssetStream& operator=(const AssetStream&) = delete;

  AssetStream(AssetStream&&) noexcept;
  AssetStream& operator=(AssetStream&&) noexcept;

  /*
    Read up to max_bytes. Returns an empty buffer once the stream is
    exhausted. Throws StoreUnavailable on I/O failure.
  */
  std::shared_ptr<arrow::Buffer> Read(int64_t max_bytes);

  void Close();

  bool closed() const {
    return file_ == nullptr;
  }

  model::AssetKind kind() const {
    return kind_;
  }

  std::string_view content_type() const {
    return model::ContentType(kind_);
  }

  const util::DeviceAddress& address() const {
    return address_;
  }

  int64_t bytes_read() const {
    return bytes_read_;
  }

 private:
  std::shared_ptr<arrow::io::ReadableFile> file_;
  util::DeviceAddress                      address_;
  model::AssetKind                         kind_;
  int64_t                                  bytes_read_ = 0;
};

} // namespace epd::storage
