// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/uri.hpp"

#include <cctype>

namespace lanpeer {
namespace util {

namespace {

bool IsSchemeChar(char c, bool first) {
  if (std::isalpha(static_cast<unsigned char>(c))) {
    return true;
  }
  if (first) {
    return false;
  }
  return std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

}  // namespace

std::optional<Uri> Uri::Parse(const std::string& str) {
  for (char c : str) {
    auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f || c == ' ') {
      return std::nullopt;
    }
  }

  Uri uri;
  std::string remainder = str;

  // Scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
  size_t colon = str.find(':');
  size_t first_delim = str.find_first_of("/?#");
  if (colon != std::string::npos && colon > 0 && (first_delim == std::string::npos || colon < first_delim)) {
    bool valid = true;
    for (size_t i = 0; i < colon; ++i) {
      if (!IsSchemeChar(str[i], i == 0)) {
        valid = false;
        break;
      }
    }
    if (!valid) {
      return std::nullopt;
    }
    uri.scheme = str.substr(0, colon);
    remainder = str.substr(colon + 1);
  } else if (colon == 0) {
    return std::nullopt;  // Missing scheme
  }

  if (remainder.compare(0, 2, "//") == 0) {
    uri.has_authority = true;
    remainder = remainder.substr(2);
    size_t end = remainder.find_first_of("/?#");
    std::string authority = remainder.substr(0, end);
    uri.rest = end == std::string::npos ? std::string() : remainder.substr(end);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
      uri.userinfo = authority.substr(0, at);
      authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[' && authority.find(']') == std::string::npos) {
      return std::nullopt;
    }
    uri.host = authority;
  } else {
    uri.rest = remainder;
  }

  return uri;
}

std::string Uri::ToString() const {
  std::string out;
  if (!scheme.empty()) {
    out += scheme;
    out += ':';
  }
  if (has_authority) {
    out += "//";
    if (!userinfo.empty()) {
      out += userinfo;
      out += '@';
    }
    out += host;
  }
  out += rest;
  return out;
}

}  // namespace util
}  // namespace lanpeer
