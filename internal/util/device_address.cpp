#include "device_address.hpp"

#include "internal/util/errors.hpp"

namespace epd::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string Format(const DeviceAddress::Bytes& bytes, const char* digits) {
  std::string out;
  out.reserve(DeviceAddress::kSize * 2);
  for (auto b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

} // namespace

DeviceAddress DeviceAddress::Parse(std::string_view text) {
  if (text.size() != kSize * 2) {
    throw InvalidAddress("device address must be " + std::to_string(kSize * 2) + " hex digits, got " +
                         std::to_string(text.size()));
  }

  Bytes bytes{};
  for (std::size_t i = 0; i < kSize; ++i) {
    const int hi = HexNibble(text[2 * i]);
    const int lo = HexNibble(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidAddress("device address contains non-hex character: '" + std::string(text) + "'");
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return DeviceAddress(bytes);
}

std::string DeviceAddress::ToString() const {
  return Format(bytes_, "0123456789ABCDEF");
}

std::string DeviceAddress::ToLowerString() const {
  return Format(bytes_, "0123456789abcdef");
}

} // namespace epd::util
