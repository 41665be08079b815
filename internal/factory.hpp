#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/image_store.hpp"
#include "internal/render/rasterizer.hpp"

namespace epd::factory {

/*
  Application

  Owns every long-lived object built from the runtime config.
  grpc_services is handed to runtime::Server; store stays shared with the
  services for the process lifetime.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<core::ImageStore>             store;
};

/*
  Build full application dependency graph.

  The config must already have defaults applied and be validated. Throws
  std::runtime_error if the image directory is unusable.
*/
Application Build(const epd::runtime::config::RuntimeConfig& config);

/*
  Same graph with a caller-supplied rasterizer. Tests use this to inject
  failures without touching librsvg.
*/
Application Build(const epd::runtime::config::RuntimeConfig& config, render::RasterizerPtr rasterizer);

} // namespace epd::factory
