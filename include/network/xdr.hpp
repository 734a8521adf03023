// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

// XDR (RFC 4506) primitives used by the discovery wire format.
// All integers are big-endian; variable-length opaque data and strings carry a
// uint32 length prefix and are zero-padded to a multiple of 4 bytes.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lanpeer {
namespace xdr {

// Serialization buffer for building XDR encoded messages
class XdrWriter {
public:
  XdrWriter() = default;

  void write_uint32(uint32_t value);
  void write_int32(int32_t value);
  void write_opaque(const uint8_t* data, size_t len);
  void write_opaque(const std::vector<uint8_t>& data) { write_opaque(data.data(), data.size()); }
  void write_string(const std::string& str);

  const std::vector<uint8_t>& data() const { return buffer_; }
  size_t size() const { return buffer_.size(); }

private:
  void pad(size_t len);

  std::vector<uint8_t> buffer_;
};

// Deserialization buffer for parsing XDR encoded messages.
// Errors are sticky: once a read fails every later read returns a zero value
// and has_error() stays true, so callers can check once after a sequence.
class XdrReader {
public:
  XdrReader(const uint8_t* data, size_t size);
  explicit XdrReader(const std::vector<uint8_t>& data);

  uint32_t read_uint32();
  int32_t read_int32();

  // Variable-length reads fail with limit_exceeded() when the encoded length
  // is larger than max_length.
  std::vector<uint8_t> read_opaque(size_t max_length);
  std::string read_string(size_t max_length);

  bool has_error() const { return error_; }
  bool limit_exceeded() const { return limit_exceeded_; }

  // Mark the stream as failed because a decoded count exceeded its limit
  void fail_limit() {
    error_ = true;
    limit_exceeded_ = true;
  }

private:
  bool check_available(size_t bytes);
  void skip_padding(size_t len);

  const uint8_t* data_;
  size_t size_;
  size_t position_{0};
  bool error_{false};
  bool limit_exceeded_{false};
};

}  // namespace xdr
}  // namespace lanpeer
