// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/announcement.hpp"

#include "network/device_id.hpp"
#include "network/xdr.hpp"

namespace lanpeer {
namespace protocol {

const char* DecodeErrorString(DecodeError err) {
  switch (err) {
  case DecodeError::OK:
    return "ok";
  case DecodeError::IncorrectMagic:
    return "incorrect magic number";
  case DecodeError::Truncated:
    return "truncated announcement";
  case DecodeError::LimitExceeded:
    return "element count or length exceeds limit";
  case DecodeError::InvalidDeviceID:
    return "invalid device id length";
  }
  return "unknown";
}

std::vector<uint8_t> Announce::MarshalXDR() const {
  xdr::XdrWriter w;
  w.write_uint32(magic);
  w.write_opaque(this_device.id);

  w.write_uint32(static_cast<uint32_t>(this_device.addresses.size()));
  for (const auto& addr : this_device.addresses) {
    w.write_string(addr);
  }

  w.write_uint32(static_cast<uint32_t>(this_device.relays.size()));
  for (const auto& relay : this_device.relays) {
    w.write_string(relay.url);
    w.write_int32(relay.latency);
  }

  return w.data();
}

DecodeError Announce::UnmarshalXDR(const uint8_t* data, size_t size) {
  xdr::XdrReader r(data, size);

  uint32_t decoded_magic = r.read_uint32();
  if (r.has_error()) {
    return DecodeError::Truncated;
  }
  if (decoded_magic != ANNOUNCEMENT_MAGIC) {
    return DecodeError::IncorrectMagic;
  }

  Device device;
  device.id = r.read_opaque(MAX_DEVICE_ID_LENGTH);

  uint32_t num_addresses = r.read_uint32();
  if (!r.has_error() && num_addresses > MAX_ADDRESSES) {
    r.fail_limit();
  }
  for (uint32_t i = 0; i < num_addresses && !r.has_error(); ++i) {
    device.addresses.push_back(r.read_string(MAX_URL_LENGTH));
  }

  uint32_t num_relays = r.read_uint32();
  if (!r.has_error() && num_relays > MAX_RELAYS) {
    r.fail_limit();
  }
  for (uint32_t i = 0; i < num_relays && !r.has_error(); ++i) {
    Relay relay;
    relay.url = r.read_string(MAX_URL_LENGTH);
    relay.latency = r.read_int32();
    device.relays.push_back(std::move(relay));
  }

  if (r.has_error()) {
    return r.limit_exceeded() ? DecodeError::LimitExceeded : DecodeError::Truncated;
  }
  if (device.id.size() != DeviceID::SIZE) {
    return DecodeError::InvalidDeviceID;
  }

  magic = decoded_magic;
  this_device = std::move(device);
  return DecodeError::OK;
}

}  // namespace protocol
}  // namespace lanpeer
