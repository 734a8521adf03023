// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>

namespace lanpeer {
namespace util {

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  if (str.empty()) {
    return std::nullopt;
  }

  int64_t value = 0;
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 0, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

}  // namespace util
}  // namespace lanpeer
