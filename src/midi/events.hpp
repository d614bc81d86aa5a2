// src/midi/events.hpp
// Core MIDI domain types: the editable tree a Standard MIDI File decodes to.
// Keep this header light: plain structs, no parsing logic.
//
//   MidiFile ── tracks ──> Track ── events ──> Event
//
// Only note on/off events are interpreted (note + velocity). Every other
// event keeps the bytes it was parsed from in `payload`, so writing an
// untouched file back produces the same bytes.

#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace midi {

// Event class selected by the high nibble of the status byte.
enum class EvType : std::uint8_t {
  NoteOff = 0x8,
  NoteOn = 0x9,
  PolyPressure = 0xA,
  ControlChange = 0xB,
  ProgramChange = 0xC,
  ChannelPressure = 0xD,
  PitchBend = 0xE,
  System = 0xF, // sysex (F0/F7) and meta (FF)
};

struct Event {
  std::uint64_t delta = 0;  // ticks since the previous event in the track
  std::uint8_t status = 0;  // raw status byte, written back verbatim
  std::optional<std::uint8_t> note;     // NoteOn/NoteOff only
  std::optional<std::uint8_t> velocity; // NoteOn/NoteOff only
  std::vector<std::uint8_t> payload;    // everything else, uninterpreted

  EvType type() const { return static_cast<EvType>(status >> 4); }

  // Low nibble of a channel message. Meaningless for System events.
  std::uint8_t channel() const { return status & 0x0F; }

  bool is_note() const { return note.has_value(); }

  // FF <type> <len> <data>
  bool is_meta() const { return status == 0xFF; }
};

// Events in file order. Reordering them changes their timing, since every
// delta is relative to the previous event.
struct Track {
  std::vector<Event> events;
};

struct MidiFile {
  std::uint16_t format = 0;            // 0, 1 or 2; preserved, not checked
  std::uint16_t division = 480;        // raw division word (bit 15 == 0)
  std::uint32_t header_length = 6;     // declared MThd length, kept as read
  std::vector<std::uint8_t> header_trailing; // header bytes past the first 6
  std::vector<Track> tracks;

  // Ticks per quarter note.
  unsigned ppqn() const { return division & 0x7FFFu; }
};

} // namespace midi
