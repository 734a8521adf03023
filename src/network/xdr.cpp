// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/xdr.hpp"

namespace lanpeer {
namespace xdr {

namespace {
size_t PaddingFor(size_t len) {
  return (4 - (len % 4)) % 4;
}
}  // namespace

// ============================================================================
// XdrWriter
// ============================================================================

void XdrWriter::write_uint32(uint32_t value) {
  buffer_.push_back(static_cast<uint8_t>(value >> 24));
  buffer_.push_back(static_cast<uint8_t>(value >> 16));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
  buffer_.push_back(static_cast<uint8_t>(value));
}

void XdrWriter::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void XdrWriter::write_opaque(const uint8_t* data, size_t len) {
  write_uint32(static_cast<uint32_t>(len));
  if (len > 0) {
    buffer_.insert(buffer_.end(), data, data + len);
  }
  pad(len);
}

void XdrWriter::write_string(const std::string& str) {
  write_opaque(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void XdrWriter::pad(size_t len) {
  buffer_.insert(buffer_.end(), PaddingFor(len), 0);
}

// ============================================================================
// XdrReader
// ============================================================================

XdrReader::XdrReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

XdrReader::XdrReader(const std::vector<uint8_t>& data) : data_(data.data()), size_(data.size()) {}

bool XdrReader::check_available(size_t bytes) {
  if (error_ || bytes > size_ - position_) {
    error_ = true;
    return false;
  }
  return true;
}

uint32_t XdrReader::read_uint32() {
  if (!check_available(4)) {
    return 0;
  }
  const uint8_t* p = data_ + position_;
  uint32_t value = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                   (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
  position_ += 4;
  return value;
}

int32_t XdrReader::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

std::vector<uint8_t> XdrReader::read_opaque(size_t max_length) {
  uint32_t len = read_uint32();
  if (error_) {
    return {};
  }
  if (len > max_length) {
    fail_limit();
    return {};
  }
  if (!check_available(len)) {
    return {};
  }
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + len);
  position_ += len;
  skip_padding(len);
  return out;
}

std::string XdrReader::read_string(size_t max_length) {
  auto bytes = read_opaque(max_length);
  return std::string(bytes.begin(), bytes.end());
}

void XdrReader::skip_padding(size_t len) {
  size_t padding = PaddingFor(len);
  if (!check_available(padding)) {
    return;
  }
  position_ += padding;
}

}  // namespace xdr
}  // namespace lanpeer
