// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <string>

namespace lanpeer {
namespace util {

// Minimal URI as used for advertised addresses ("tcp://0.0.0.0:22000",
// "relay://192.0.2.1:22067/?id=..."). Only the pieces the address handling
// needs are split out; everything after the authority round-trips unchanged.
struct Uri {
  std::string scheme;
  std::string userinfo;
  // Authority without userinfo, i.e. "host:port", "[v6]:port" or ":port"
  std::string host;
  // Path, query and fragment, verbatim
  std::string rest;
  // True when the URI had a "//" authority component
  bool has_authority{false};

  // Returns nullopt for strings containing spaces or control characters, an
  // invalid scheme, or a malformed bracketed host.
  static std::optional<Uri> Parse(const std::string& str);

  std::string ToString() const;
};

}  // namespace util
}  // namespace lanpeer
