// src/common/reader.hpp
// Tiny safe cursor for big-endian reads over an in-memory buffer.
// Running off the end throws midi::TruncatedStreamError, so a short file is
// reported the same way wherever the parser happens to be.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "midi/errors.hpp"

struct Bytes {
  std::vector<std::uint8_t> data;
  std::size_t off = 0; // current read position

  explicit Bytes(const std::vector<std::uint8_t> &src) : data(src), off(0) {}

  [[nodiscard]] std::size_t remaining() const { return data.size() - off; }

  [[nodiscard]] std::uint8_t u8() {
    need(1, "u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    need(2, "be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be32() {
    need(4, "be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  // Copy the next n bytes out and advance past them.
  [[nodiscard]] std::vector<std::uint8_t> take(std::size_t n) {
    need(n, "bytes");
    std::vector<std::uint8_t> out(data.begin() + off, data.begin() + off + n);
    off += n;
    return out;
  }

private:
  void need(std::size_t n, const char *what) const {
    if (n > remaining()) {
      throw midi::TruncatedStreamError(
          std::string("EOF while reading ") + what + " at offset " +
          std::to_string(off) + " (need " + std::to_string(n) + ", have " +
          std::to_string(remaining()) + ")");
    }
  }
};
