// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 Local discovery announcement (wire format)

 Announce:
   uint32   magic            ANNOUNCEMENT_MAGIC
   Device   this

 Device:
   opaque   id<32>           exactly 32 bytes accepted on decode
   string   addresses<2083><16>
   Relay    relays<16>

 Relay:
   string   url<2083>
   int32    latency          milliseconds

 XDR encoding, see network/xdr.hpp.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanpeer {
namespace protocol {

constexpr uint32_t ANNOUNCEMENT_MAGIC = 0x9D79BC40;

constexpr size_t MAX_DEVICE_ID_LENGTH = 32;
constexpr size_t MAX_ADDRESSES = 16;
constexpr size_t MAX_RELAYS = 16;
constexpr size_t MAX_URL_LENGTH = 2083;

enum class DecodeError {
  OK,
  IncorrectMagic,   // magic does not match ANNOUNCEMENT_MAGIC
  Truncated,        // payload ended before the structure was complete
  LimitExceeded,    // a length or count exceeded its protocol maximum
  InvalidDeviceID,  // device id is not exactly 32 bytes
};

const char* DecodeErrorString(DecodeError err);

struct Relay {
  std::string url;
  int32_t latency{0};  // milliseconds

  bool operator==(const Relay& other) const { return url == other.url && latency == other.latency; }
};

struct Device {
  std::vector<uint8_t> id;
  std::vector<std::string> addresses;
  std::vector<Relay> relays;
};

struct Announce {
  uint32_t magic{ANNOUNCEMENT_MAGIC};
  Device this_device;

  // Encoding never fails; the sender is responsible for respecting the limits
  std::vector<uint8_t> MarshalXDR() const;

  // On failure *this is left unmodified
  DecodeError UnmarshalXDR(const uint8_t* data, size_t size);
  DecodeError UnmarshalXDR(const std::vector<uint8_t>& data) { return UnmarshalXDR(data.data(), data.size()); }
};

}  // namespace protocol
}  // namespace lanpeer
