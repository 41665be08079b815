#pragma once

#include <filesystem>
#include <string>

#include "internal/model/asset_kind.hpp"
#include "internal/util/device_address.hpp"

namespace epd::storage::common {

/*
  Deterministic asset location:

      <root>/<lowercase-hex-address>.<extension>

  The address is already validated, so the stem can never escape root.
*/
inline std::filesystem::path AssetPath(const std::filesystem::path& root, const util::DeviceAddress& address,
                                       model::AssetKind kind) {
  std::string file_name = address.ToLowerString();
  file_name += '.';
  file_name += model::Extension(kind);
  return root / file_name;
}

} // namespace epd::storage::common
