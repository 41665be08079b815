#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "client/cpp/epd_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"

namespace {

namespace fs = std::filesystem;

using epd::client::EpdClient;
using epd::server::v1::ASSET_KIND_PREVIEW_IMAGE;
using epd::server::v1::ASSET_KIND_RASTER_IMAGE;
using epd::server::v1::ASSET_KIND_UNSPECIFIED;
using epd::server::v1::ASSET_KIND_VECTOR_SOURCE;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "epd_roundtrip_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string PatternBytes(std::size_t size) {
  std::string out(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    out[i] = static_cast<char>(i * 31 + 7);
  }
  return out;
}

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size()));
}

/*
  Real server on an ephemeral loopback port, real rasterizer, real
  filesystem. Only fonts are skipped to keep startup quick.
*/
struct Harness {
  explicit Harness(const fs::path& image_dir) {
    epd::runtime::config::RuntimeConfig config;
    config.mutable_server()->set_bind_address("127.0.0.1:0");
    config.mutable_store()->set_image_dir(image_dir.string());
    config.mutable_display()->set_width(296);
    config.mutable_display()->set_height(128);
    config.mutable_rasterizer()->set_load_system_fonts(false);
    epd::config::ConfigLoader::ApplyDefaults(&config);
    epd::config::ConfigLoader::ValidateConfig(config);

    auto app = epd::factory::Build(config);
    server   = std::make_unique<epd::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();

    const auto target = "127.0.0.1:" + std::to_string(server->selected_port());
    client = std::make_unique<EpdClient>(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));
  }

  ~Harness() {
    server->Stop();
  }

  std::unique_ptr<epd::runtime::Server> server;
  std::unique_ptr<EpdClient>            client;
};

void TestListReturnsSortedCanonicalAddresses() {
  const auto dir = FreshDir("list");
  WriteFile(dir / "aabbccddeeffaabb.png", "b");
  WriteFile(dir / "0011223344556677.png", "a");
  WriteFile(dir / "ffffffffffffffff.svg", "<svg/>");

  Harness    harness(dir);
  const auto devices = harness.client->ListDevices();
  assert(devices.ok());
  assert((*devices == std::vector<std::string>{"0011223344556677", "AABBCCDDEEFFAABB"}));
}

void TestFetchAssetStreamsInChunks() {
  const auto dir     = FreshDir("fetch");
  const auto preview = PatternBytes(100);
  const auto raster  = PatternBytes(200 * 1024);
  WriteFile(dir / "0011223344556677.png", preview);
  WriteFile(dir / "0011223344556677.bmp", raster);

  Harness harness(dir);

  const auto small = harness.client->FetchAsset("0011223344556677", ASSET_KIND_PREVIEW_IMAGE, 7);
  assert(small.ok());
  assert(small->content_type == "image/png");
  assert(AsString(small->data) == preview);

  // Larger than the default chunk.
  const auto large = harness.client->FetchAsset("0011223344556677", ASSET_KIND_RASTER_IMAGE);
  assert(large.ok());
  assert(large->content_type == "image/bmp");
  assert(AsString(large->data) == raster);
}

void TestFetchAssetErrors() {
  const auto dir = FreshDir("fetch_errors");
  WriteFile(dir / "0011223344556677.png", "p");

  Harness harness(dir);

  const auto missing = harness.client->FetchAsset("0011223344556677", ASSET_KIND_VECTOR_SOURCE);
  assert(!missing.ok());
  assert(missing.status().IsKeyError());

  const auto unspecified = harness.client->FetchAsset("0011223344556677", ASSET_KIND_UNSPECIFIED);
  assert(!unspecified.ok());
  assert(unspecified.status().IsInvalid());

  const auto bad_address = harness.client->FetchAsset("00112233", ASSET_KIND_PREVIEW_IMAGE);
  assert(!bad_address.ok());
  assert(bad_address.status().IsInvalid());
}

void TestSubmitThenFetchThenDelete() {
  const auto dir = FreshDir("submit");

  Harness harness(dir);

  const auto display = harness.client->GetDisplay();
  assert(display.ok());
  assert(display->width() == 296);
  assert(display->height() == 128);

  const auto submitted =
      harness.client->SubmitVector("aabbccddeeffaabb", "<rect x=\"10\" y=\"10\" width=\"100\" height=\"50\" fill=\"black\"/>");
  assert(submitted.ok());
  assert(submitted->address() == "AABBCCDDEEFFAABB");
  assert(submitted->geometry().width() == 296);
  assert(submitted->preview_size_bytes() > 0);

  const auto svg = harness.client->FetchAsset("AABBCCDDEEFFAABB", ASSET_KIND_VECTOR_SOURCE);
  assert(svg.ok());
  assert(svg->content_type == "image/svg+xml");
  const auto svg_text = AsString(svg->data);
  assert(svg_text.rfind("<svg", 0) == 0);
  assert(svg_text.find("viewBox=\"0 0 296 128\"") != std::string::npos);
  assert(svg_text.size() == submitted->vector_size_bytes());

  const auto png = harness.client->FetchAsset("AABBCCDDEEFFAABB", ASSET_KIND_PREVIEW_IMAGE);
  assert(png.ok());
  assert(static_cast<std::uint64_t>(png->data->size()) == submitted->preview_size_bytes());

  const auto devices = harness.client->ListDevices();
  assert(devices.ok());
  assert((*devices == std::vector<std::string>{"AABBCCDDEEFFAABB"}));

  assert(harness.client->DeleteDevice("aabbccddeeffaabb").ok());
  assert(!fs::exists(dir / "aabbccddeeffaabb.png"));
  assert(!fs::exists(dir / "aabbccddeeffaabb.svg"));

  const auto again = harness.client->DeleteDevice("aabbccddeeffaabb");
  assert(!again.ok());
  assert(again.IsKeyError());

  const auto after = harness.client->ListDevices();
  assert(after.ok());
  assert(after->empty());
}

void TestSubmitMalformedMarkupLeavesNoFiles() {
  const auto dir = FreshDir("submit_malformed");

  Harness    harness(dir);
  const auto submitted = harness.client->SubmitVector("0011223344556677", "<circle cx=\"1\"");
  assert(!submitted.ok());
  assert(submitted.status().IsInvalid());
  assert(fs::is_empty(dir));
}

void TestBuildRejectsMissingImageDir() {
  epd::runtime::config::RuntimeConfig config;
  config.mutable_store()->set_image_dir((FreshDir("build_missing") / "absent").string());
  config.mutable_display()->set_width(1);
  config.mutable_display()->set_height(1);
  config.mutable_rasterizer()->set_load_system_fonts(false);

  bool threw = false;
  try {
    (void)epd::factory::Build(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  config.mutable_store()->set_create_if_missing(true);
  auto app = epd::factory::Build(config);
  assert(fs::is_directory(config.store().image_dir()));
  assert(app.grpc_services.size() == 1);
}

} // namespace

int main() {
  TestListReturnsSortedCanonicalAddresses();
  TestFetchAssetStreamsInChunks();
  TestFetchAssetErrors();
  TestSubmitThenFetchThenDelete();
  TestSubmitMalformedMarkupLeavesNoFiles();
  TestBuildRejectsMissingImageDir();

  std::cout << "epd_integration_image_service_roundtrip: pass\n";
  return 0;
}
