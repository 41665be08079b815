#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace epd::util {

/*
  DeviceAddress

  8 byte hardware address of one display. Canonical text form is
  16 uppercase hex characters, most significant byte first.
  Parsing accepts either case.
*/
class DeviceAddress {
 public:
  static constexpr std::size_t kSize = 8;
  using Bytes = std::array<std::uint8_t, kSize>;

  DeviceAddress() = default;
  explicit DeviceAddress(const Bytes& bytes) : bytes_(bytes) {
  }

  // Throws InvalidAddress unless text is exactly 16 hex digits.
  static DeviceAddress Parse(std::string_view text);

  std::string ToString() const;
  // File stem form.
  std::string ToLowerString() const;

  const Bytes& bytes() const {
    return bytes_;
  }

  friend bool operator==(const DeviceAddress&, const DeviceAddress&) = default;
  friend auto operator<=>(const DeviceAddress&, const DeviceAddress&) = default;

 private:
  Bytes bytes_{};
};

} // namespace epd::util
