// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lanpeer {
namespace util {

// Parse a decimal integer in [min, max]. Rejects empty input, signs other than a
// leading '-', whitespace and trailing characters.
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// Parse a port number (0-65535).
std::optional<uint16_t> SafeParsePort(const std::string& str);

}  // namespace util
}  // namespace lanpeer
