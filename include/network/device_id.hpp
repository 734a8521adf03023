// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanpeer {
namespace protocol {

// DeviceID - 32-byte node identifier (SHA-256 of the node's certificate)
//
// String form: base32 (RFC 4648, no padding), a Luhn mod-32 check character
// after every 13 characters, grouped by dashes into 8 blocks of 7:
//   MFZWI3D-BONSGYC-YLTMRWG-C43ENR5-QXGZDMM-FZWI3DP-BONSGYY-LTMRWAD
class DeviceID {
public:
  static constexpr size_t SIZE = 32;

  DeviceID() noexcept { bytes_.fill(0); }
  explicit DeviceID(const std::array<uint8_t, SIZE>& bytes) noexcept : bytes_(bytes) {}

  // Build from raw bytes. Returns nullopt unless exactly SIZE bytes are given.
  static std::optional<DeviceID> FromBytes(const std::vector<uint8_t>& bytes);

  // Parse the checked (56 char) or unchecked (52 char) string form. Dashes and
  // spaces are ignored, letters are case-insensitive.
  static std::optional<DeviceID> FromString(const std::string& str);

  std::string ToString() const;

  std::vector<uint8_t> ToVector() const { return std::vector<uint8_t>(bytes_.begin(), bytes_.end()); }
  const std::array<uint8_t, SIZE>& bytes() const noexcept { return bytes_; }
  bool IsNull() const noexcept;

  bool operator==(const DeviceID& other) const noexcept { return bytes_ == other.bytes_; }
  bool operator!=(const DeviceID& other) const noexcept { return bytes_ != other.bytes_; }
  bool operator<(const DeviceID& other) const noexcept { return bytes_ < other.bytes_; }

private:
  std::array<uint8_t, SIZE> bytes_;
};

// Luhn mod-32 check character over the base32 alphabet.
// Returns '\0' if str contains a character outside the alphabet.
char LuhnBase32(const std::string& str);

}  // namespace protocol
}  // namespace lanpeer

namespace std {
template <>
struct hash<lanpeer::protocol::DeviceID> {
  size_t operator()(const lanpeer::protocol::DeviceID& id) const noexcept {
    // Device IDs are hash outputs; the leading bytes are already uniform
    size_t h = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i) {
      h = (h << 8) | id.bytes()[i];
    }
    return h;
  }
};
}  // namespace std
