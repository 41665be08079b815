#pragma once

#include <memory>

namespace epd::core { class ImageStore; }

namespace epd::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<epd::core::ImageStore> store;
};

}
