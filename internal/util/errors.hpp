#pragma once

#include <stdexcept>
#include <string>

namespace epd::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Messages name the device and the operation, never a filesystem path.
*/

// Request field outside its accepted range (e.g. unspecified asset kind).
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed device address text. Client input error.
class InvalidAddress : public std::runtime_error {
 public:
  explicit InvalidAddress(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Vector markup the rasterizer rejects. Client input error.
class InvalidVectorInput : public std::runtime_error {
 public:
  explicit InvalidVectorInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AssetNotFound : public std::runtime_error {
 public:
  explicit AssetNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Directory or file I/O failure, or an internal rasterizer failure.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace epd::util
