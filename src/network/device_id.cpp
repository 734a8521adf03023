// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/device_id.hpp"

#include <algorithm>
#include <cctype>

namespace lanpeer {
namespace protocol {

namespace {

constexpr char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr size_t BASE32_LEN = 52;   // ceil(32 * 8 / 5)
constexpr size_t CHECKED_LEN = 56;  // 4 groups of 13 + 1 check char
constexpr size_t LUHN_GROUP = 13;
constexpr size_t DISPLAY_GROUP = 7;

int Base32Value(char c) {
  const char* pos = std::find(BASE32_ALPHABET, BASE32_ALPHABET + 32, c);
  if (pos == BASE32_ALPHABET + 32) {
    return -1;
  }
  return static_cast<int>(pos - BASE32_ALPHABET);
}

std::string Base32Encode(const std::array<uint8_t, DeviceID::SIZE>& data) {
  std::string out;
  out.reserve(BASE32_LEN);
  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t byte : data) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1f]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1f]);
  }
  return out;
}

std::optional<std::array<uint8_t, DeviceID::SIZE>> Base32Decode(const std::string& str) {
  if (str.size() != BASE32_LEN) {
    return std::nullopt;
  }

  std::array<uint8_t, DeviceID::SIZE> out{};
  size_t pos = 0;
  uint32_t buffer = 0;
  int bits = 0;
  for (char c : str) {
    int v = Base32Value(c);
    if (v < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      if (pos < out.size()) {
        out[pos++] = static_cast<uint8_t>((buffer >> (bits - 8)) & 0xff);
      }
      bits -= 8;
    }
  }
  // 52 chars carry 260 bits; the 4 trailing pad bits must be zero
  if (pos != out.size() || (buffer & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

char LuhnBase32(const std::string& str) {
  const int n = 32;
  int factor = 1;
  int sum = 0;
  for (char c : str) {
    int codepoint = Base32Value(c);
    if (codepoint < 0) {
      return '\0';
    }
    int addend = factor * codepoint;
    factor = factor == 2 ? 1 : 2;
    addend = (addend / n) + (addend % n);
    sum += addend;
  }
  int remainder = sum % n;
  int check = (n - remainder) % n;
  return BASE32_ALPHABET[check];
}

std::optional<DeviceID> DeviceID::FromBytes(const std::vector<uint8_t>& bytes) {
  if (bytes.size() != SIZE) {
    return std::nullopt;
  }
  std::array<uint8_t, SIZE> arr;
  std::copy(bytes.begin(), bytes.end(), arr.begin());
  return DeviceID(arr);
}

std::optional<DeviceID> DeviceID::FromString(const std::string& str) {
  std::string clean;
  clean.reserve(str.size());
  for (char c : str) {
    if (c == '-' || c == ' ') {
      continue;
    }
    clean.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }

  if (clean.size() == CHECKED_LEN) {
    std::string unchecked;
    unchecked.reserve(BASE32_LEN);
    for (size_t i = 0; i < 4; ++i) {
      std::string group = clean.substr(i * (LUHN_GROUP + 1), LUHN_GROUP);
      char check = clean[i * (LUHN_GROUP + 1) + LUHN_GROUP];
      if (LuhnBase32(group) != check) {
        return std::nullopt;
      }
      unchecked += group;
    }
    clean = std::move(unchecked);
  }

  auto bytes = Base32Decode(clean);
  if (!bytes) {
    return std::nullopt;
  }
  return DeviceID(*bytes);
}

std::string DeviceID::ToString() const {
  std::string encoded = Base32Encode(bytes_);

  std::string checked;
  checked.reserve(CHECKED_LEN);
  for (size_t i = 0; i < 4; ++i) {
    std::string group = encoded.substr(i * LUHN_GROUP, LUHN_GROUP);
    checked += group;
    checked.push_back(LuhnBase32(group));
  }

  std::string out;
  out.reserve(CHECKED_LEN + CHECKED_LEN / DISPLAY_GROUP - 1);
  for (size_t i = 0; i < checked.size(); i += DISPLAY_GROUP) {
    if (i > 0) {
      out.push_back('-');
    }
    out += checked.substr(i, DISPLAY_GROUP);
  }
  return out;
}

bool DeviceID::IsNull() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace protocol
}  // namespace lanpeer
