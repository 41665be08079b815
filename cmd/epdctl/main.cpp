#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "client/cpp/epd_client.h"
#include "epd/server/v1.hpp"

using epd::client::EpdClient;
using namespace epd::server::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  epdctl <addr> list\n"
            << "  epdctl <addr> get <mac> <svg|png|bmp> [out_file]\n"
            << "  epdctl <addr> delete <mac>\n"
            << "  epdctl <addr> put <mac> <svg_body_file|->\n"
            << "  epdctl <addr> display\n";
}

static std::optional<AssetKind> ParseKind(const std::string& value) {
  if (value == "svg") {
    return ASSET_KIND_VECTOR_SOURCE;
  }
  if (value == "bmp") {
    return ASSET_KIND_RASTER_IMAGE;
  }
  if (value == "png") {
    return ASSET_KIND_PREVIEW_IMAGE;
  }
  return std::nullopt;
}

static std::optional<std::string> ReadBody(const std::string& source) {
  std::ostringstream body;
  if (source == "-") {
    body << std::cin.rdbuf();
    return body.str();
  }

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  body << in.rdbuf();
  return body.str();
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  EpdClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "list") {
    auto devices = client.ListDevices();
    if (!devices.ok()) {
      std::cerr << devices.status().ToString() << "\n";
      return 2;
    }

    for (const auto& device : *devices) {
      std::cout << device << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto kind = ParseKind(argv[4]);
    if (!kind.has_value()) {
      std::cerr << "unsupported asset kind: " << argv[4] << "\n";
      return 1;
    }

    auto asset = client.FetchAsset(argv[3], kind.value());
    if (!asset.ok()) {
      std::cerr << asset.status().ToString() << "\n";
      return 2;
    }

    const auto& data = asset->data;
    if (argc >= 6) {
      std::ofstream out(argv[5], std::ios::binary | std::ios::trunc);
      out.write(reinterpret_cast<const char*>(data->data()), data->size());
      if (!out) {
        std::cerr << "failed to write " << argv[5] << "\n";
        return 2;
      }
      std::cout << "content_type=" << asset->content_type << " bytes=" << data->size() << "\n";
    } else {
      std::cout.write(reinterpret_cast<const char*>(data->data()), data->size());
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto status = client.DeleteDevice(argv[3]);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "put") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto body = ReadBody(argv[4]);
    if (!body.has_value()) {
      std::cerr << "cannot read " << argv[4] << "\n";
      return 1;
    }

    auto resp = client.SubmitVector(argv[3], *body);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }

    std::cout << "device=" << resp->address() << " width=" << resp->geometry().width()
              << " height=" << resp->geometry().height() << " png_bytes=" << resp->preview_size_bytes()
              << " svg_bytes=" << resp->vector_size_bytes() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "display") {
    auto geometry = client.GetDisplay();
    if (!geometry.ok()) {
      std::cerr << geometry.status().ToString() << "\n";
      return 2;
    }

    std::cout << "width=" << geometry->width() << " height=" << geometry->height() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
