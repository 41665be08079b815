#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/grpc/image_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/render/rsvg_rasterizer.hpp"
#include "internal/service/image_service.hpp"
#include "internal/service/service_context.hpp"

namespace epd::factory {

using namespace epd;

namespace fs = std::filesystem;

namespace {

fs::path PrepareImageDir(const epd::runtime::config::StoreConfig& store) {
  const fs::path  dir = store.image_dir();
  std::error_code ec;

  if (store.create_if_missing() && !fs::exists(dir, ec)) {
    fs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("cannot create image directory " + dir.string() + ": " + ec.message());
    }
    EPD_LOG_INFO("created image directory", {observability::StringField("image_dir", dir.string())});
  }

  if (!fs::is_directory(dir, ec)) {
    throw std::runtime_error("image directory " + dir.string() + " does not exist or is not a directory");
  }

  return dir;
}

} // namespace

Application Build(const epd::runtime::config::RuntimeConfig& config) {
  render::RsvgRasterizer::Options options;
  options.load_system_fonts = config.rasterizer().load_system_fonts();

  return Build(config, std::make_shared<render::RsvgRasterizer>(options));
}

Application Build(const epd::runtime::config::RuntimeConfig& config, render::RasterizerPtr rasterizer) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  model::StoreOptions store_options;
  store_options.root            = PrepareImageDir(config.store());
  store_options.geometry.width  = config.display().width();
  store_options.geometry.height = config.display().height();

  app.store = std::make_shared<core::ImageStore>(store_options, std::move(rasterizer));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store = app.store;

  auto image_service = std::make_shared<service::ImageService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ImageServer>(image_service));

  EPD_LOG_INFO("image store ready", {observability::StringField("image_dir", store_options.root.string()),
                                     observability::IntField("width", store_options.geometry.width),
                                     observability::IntField("height", store_options.geometry.height)});

  return app;
}

} // namespace epd::factory
