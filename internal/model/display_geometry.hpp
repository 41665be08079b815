#pragma once

#include <cstdint>
#include <filesystem>

namespace epd::model {

// Pixel size of the physical display. Fixed at startup.
struct DisplayGeometry {
  std::uint32_t width = 0;
  std::uint32_t height = 0;
};

/*
  Process-wide store configuration, injected into ImageStore.
  Read only after construction.
*/
struct StoreOptions {
  std::filesystem::path root;
  DisplayGeometry geometry;
};

}  // namespace epd::model
