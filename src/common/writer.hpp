// src/common/writer.hpp
// Counterpart of Bytes: an append-only buffer with big-endian writes.
// Used by the serializers; writing never fails.
#pragma once
#include <cstdint>
#include <vector>

struct ByteSink {
  std::vector<std::uint8_t> data;

  void u8(std::uint8_t v) { data.push_back(v); }

  void be16(std::uint16_t v) {
    data.push_back(static_cast<std::uint8_t>(v >> 8));
    data.push_back(static_cast<std::uint8_t>(v));
  }

  void be32(std::uint32_t v) {
    data.push_back(static_cast<std::uint8_t>(v >> 24));
    data.push_back(static_cast<std::uint8_t>(v >> 16));
    data.push_back(static_cast<std::uint8_t>(v >> 8));
    data.push_back(static_cast<std::uint8_t>(v));
  }

  // Four-character chunk tag, e.g. "MThd".
  void tag(const char (&id)[5]) { data.insert(data.end(), id, id + 4); }

  void append(const std::vector<std::uint8_t> &bytes) {
    data.insert(data.end(), bytes.begin(), bytes.end());
  }
};
