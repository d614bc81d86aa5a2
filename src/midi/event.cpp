// src/midi/event.cpp
// Event-level codec: one delta-time + status + payload unit.

#include "midi/errors.hpp"
#include "midi/smf.hpp"
#include "midi/vlq.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <vector>

namespace {

// Meta and sysex events: FF <type> <vlq len> <data>, or F0/F7 <vlq len>
// <data>. The length bytes are kept as they were on the wire, so an
// over-long (non-minimal) length encoding survives a round trip.
std::size_t read_system_payload(Bytes &r, std::uint8_t status,
                                std::vector<std::uint8_t> &out) {
  std::size_t n = 0;
  if ((status & 0x0F) == 0x0F) {
    out.push_back(r.u8()); // meta type, not interpreted
    ++n;
  }

  const std::size_t lenStart = r.off;
  const midi::Vlq len = midi::read_vlq(r);
  out.insert(out.end(), r.data.begin() + lenStart, r.data.begin() + r.off);
  n += len.size;

  std::vector<std::uint8_t> body = r.take(static_cast<std::size_t>(len.value));
  out.insert(out.end(), body.begin(), body.end());
  return n + body.size();
}

} // namespace

namespace midi {

ParsedEvent parse_event(Bytes &r) {
  ParsedEvent p;
  Event &ev = p.event;

  // 1) Delta-time
  const Vlq delta = read_vlq(r);
  ev.delta = delta.value;

  // 2) Status byte
  ev.status = r.u8();
  std::size_t payloadSize = 0;

  // 3) Dispatch on the type nibble
  switch (ev.status >> 4) {
  case 0x8:
  case 0x9:
    // Note Off / Note On: key, velocity
    ev.note = r.u8();
    ev.velocity = r.u8();
    payloadSize = 2;
    break;
  case 0xA:
  case 0xB:
  case 0xE:
    // Poly aftertouch, Control Change, Pitch Bend: two data bytes
    ev.payload = r.take(2);
    payloadSize = 2;
    break;
  case 0xC:
  case 0xD:
    // Program Change, Channel Pressure: one data byte
    ev.payload = r.take(1);
    payloadSize = 1;
    break;
  case 0xF:
    payloadSize = read_system_payload(r, ev.status, ev.payload);
    break;
  default: {
    // 0x00..0x7F is a data byte: either running status or garbage.
    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(ev.status) << " at offset " << std::dec << (r.off - 1)
        << " (running status is not supported)";
    throw MalformedEventError(oss.str());
  }
  }

  // 4) Bytes consumed by this event
  p.size = delta.size + 1 + payloadSize;
  return p;
}

void write_event(ByteSink &w, const Event &ev) {
  write_vlq(w, ev.delta);
  w.u8(ev.status);
  if (ev.note) {
    w.u8(*ev.note);
    w.u8(ev.velocity.value_or(0));
  } else {
    w.append(ev.payload);
  }
}

std::vector<std::uint8_t> serialize_event(const Event &ev) {
  ByteSink w;
  write_event(w, ev);
  return w.data;
}

} // namespace midi
