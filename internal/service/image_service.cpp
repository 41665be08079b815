#include "image_service.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/core/image_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/device_address.hpp"
#include "internal/util/errors.hpp"

namespace epd::service {

using namespace epd::server::v1;
using epd::observability::DeviceField;
using epd::observability::IntField;
using epd::observability::StringField;

namespace {

// Runs fn(span) under a span named after the route and records the request
// counter and latency. Failures are logged with route and device, then
// rethrown for the transport to map.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view device, Fn&& fn) {
  epd::observability::SpanScope span(route);
  if (!device.empty()) {
    span.TagDevice(device);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    epd::observability::Metrics::Instance().RecordRequest(route, success);
    epd::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, epd::observability::SpanScope&>>) {
      fn(span);
      finish(true);
      return;
    } else {
      auto result = fn(span);
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    EPD_LOG_ERROR("RPC failed", {StringField("route", route), StringField("device", device), StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

epd::model::AssetKind ToModelKind(AssetKind kind) {
  switch (kind) {
    case ASSET_KIND_VECTOR_SOURCE:
      return epd::model::AssetKind::kVectorSource;
    case ASSET_KIND_RASTER_IMAGE:
      return epd::model::AssetKind::kRasterImage;
    case ASSET_KIND_PREVIEW_IMAGE:
      return epd::model::AssetKind::kPreviewImage;
    default:
      throw epd::util::InvalidArgument("get asset: asset kind must be vector, raster or preview");
  }
}

} // namespace

ImageService::ImageService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListDevicesResponse ImageService::ListDevices(const ListDevicesRequest&) {
  return ObserveRpc("ImageService.ListDevices", "", [&](epd::observability::SpanScope&) {
    auto devices = ctx_.store->ListDevices();
    std::sort(devices.begin(), devices.end());

    ListDevicesResponse resp;
    for (const auto& device : devices) {
      resp.add_addresses(device.ToString());
    }
    return resp;
  });
}

ImageService::StreamOutcome ImageService::StreamAsset(const GetAssetRequest& req,
                                                     const CancelCheck& cancelled,
                                                     const ChunkWriter& write) {
  return ObserveRpc("ImageService.GetAsset", req.address(), [&](epd::observability::SpanScope& span) {
    const auto address    = epd::util::DeviceAddress::Parse(req.address());
    const auto kind       = ToModelKind(req.kind());
    const auto chunk_size = ResolveChunkSize(req.chunk_size_bytes());
    span.TagAssetKind(epd::model::ToString(kind));

    auto stream = ctx_.store->ReadAsset(address, kind);

    bool first = true;
    while (true) {
      if (cancelled && cancelled()) {
        EPD_LOG_INFO("asset stream cancelled", {DeviceField(stream.address()), IntField("bytes_sent", stream.bytes_read())});
        return StreamOutcome::kCancelled;
      }

      auto buffer = stream.Read(chunk_size);
      if (buffer->size() == 0 && !first) {
        break;
      }

      AssetChunk chunk;
      if (first) {
        chunk.set_content_type(std::string(stream.content_type()));
        first = false;
      }
      chunk.set_data(buffer->data(), static_cast<size_t>(buffer->size()));

      if (!write(chunk)) {
        EPD_LOG_INFO("asset stream abandoned by client", {DeviceField(stream.address()), IntField("bytes_sent", stream.bytes_read())});
        return StreamOutcome::kClientGone;
      }
      if (buffer->size() == 0) {
        break;
      }
    }

    const auto served = static_cast<std::uint64_t>(stream.bytes_read());
    span.TagByteCount(served);
    epd::observability::Metrics::Instance().AddBytesServed(epd::model::ToString(kind), served);
    return StreamOutcome::kCompleted;
  });
}

void ImageService::DeleteDevice(const DeleteDeviceRequest& req) {
  ObserveRpc("ImageService.DeleteDevice", req.address(), [&](epd::observability::SpanScope&) {
    ctx_.store->DeleteDevice(epd::util::DeviceAddress::Parse(req.address()));
  });
}

SubmitVectorResponse ImageService::SubmitVector(const SubmitVectorRequest& req) {
  return ObserveRpc("ImageService.SubmitVector", req.address(), [&](epd::observability::SpanScope& span) {
    const auto address = epd::util::DeviceAddress::Parse(req.address());

    const auto started_at = std::chrono::steady_clock::now();
    const auto result     = ctx_.store->RenderAndStore(address, req.body());
    epd::observability::Metrics::Instance().ObserveRenderDurationMs(
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

    span.TagByteCount(result.preview_size_bytes);

    SubmitVectorResponse resp;
    resp.set_address(address.ToString());
    resp.mutable_geometry()->set_width(result.geometry.width);
    resp.mutable_geometry()->set_height(result.geometry.height);
    resp.set_preview_size_bytes(result.preview_size_bytes);
    resp.set_vector_size_bytes(result.vector_size_bytes);
    return resp;
  });
}

GetDisplayResponse ImageService::GetDisplay(const GetDisplayRequest&) {
  GetDisplayResponse resp;
  resp.mutable_geometry()->set_width(ctx_.store->options().geometry.width);
  resp.mutable_geometry()->set_height(ctx_.store->options().geometry.height);
  return resp;
}

std::uint32_t ImageService::ResolveChunkSize(std::uint32_t requested) {
  if (requested == 0) {
    return kDefaultChunkBytes;
  }
  return std::min(requested, kMaxChunkBytes);
}

} // namespace epd::service
