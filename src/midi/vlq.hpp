// src/midi/vlq.hpp
// MIDI VLQ (Variable Length Quantity), used for delta-times and for the
// length prefix of meta / sysex events.
// Each byte contributes 7 bits, most significant group first; a set high
// bit means "more bytes follow".
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/reader.hpp"
#include "common/writer.hpp"

namespace midi {

// A decoded VLQ and how many bytes it took on the wire.
struct Vlq {
  std::uint64_t value = 0;
  std::size_t size = 0;
};

// Read a VLQ. No limit on the number of groups is enforced: well-formed
// files never use more than 4, anything longer just keeps shifting.
inline Vlq read_vlq(Bytes &r) {
  Vlq v;
  for (;;) {
    const std::uint8_t b = r.u8();
    ++v.size;
    v.value = (v.value << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      break; // high bit 0 => last byte
  }
  return v;
}

// Number of bytes encode_vlq(value) produces (at least 1).
inline std::size_t vlq_size(std::uint64_t value) {
  std::size_t n = 1;
  while (value >>= 7)
    ++n;
  return n;
}

// Append the minimal encoding of value. Zero is a single 0x00 byte.
inline void write_vlq(ByteSink &w, std::uint64_t value) {
  const std::size_t n = vlq_size(value);
  for (std::size_t i = n; i-- > 0;) {
    auto group = static_cast<std::uint8_t>((value >> (7 * i)) & 0x7F);
    if (i != 0)
      group |= 0x80;
    w.u8(group);
  }
}

inline std::vector<std::uint8_t> encode_vlq(std::uint64_t value) {
  ByteSink w;
  write_vlq(w, value);
  return w.data;
}

} // namespace midi
