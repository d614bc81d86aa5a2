// src/midi/smf.hpp
// Public API: decode a Standard MIDI File (SMF) from memory into a MidiFile,
// and encode a MidiFile back into bytes.
// - No printing here; pure data in, data out.
// - Parsing throws the exceptions in midi/errors.hpp; writing never throws.
// - parse_smf(b) followed by write_smf() reproduces b exactly as long as
//   nothing was edited (trailing bytes after the last track excepted).

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/reader.hpp"
#include "common/writer.hpp"
#include "midi/events.hpp"

namespace midi {

// An event together with the number of bytes it occupied in the track
// (delta-time + status + payload).
struct ParsedEvent {
  Event event;
  std::size_t size = 0;
};

// Parse one event at the cursor. Running status is not supported: a data
// byte where a status byte is expected throws MalformedEventError.
ParsedEvent parse_event(Bytes &r);

// Append the encoding of one event: VLQ delta, status, then note + velocity
// or the opaque payload. Values are written as stored, nothing is clamped.
void write_event(ByteSink &w, const Event &ev);
std::vector<std::uint8_t> serialize_event(const Event &ev);

// Parse one 'MTrk' chunk. The declared length must be consumed exactly by
// whole events, otherwise MalformedTrackError is thrown.
Track parse_track(Bytes &r);

// Append an 'MTrk' chunk. The length prefix is recomputed from the events.
void write_track(ByteSink &w, const Track &track);

// Parse an entire file already loaded in memory. Exactly as many tracks as
// the header announces are read; bytes after them are ignored.
MidiFile parse_smf(const std::vector<std::uint8_t> &bytes);

// Encode the whole tree. The header length and trailing header bytes are
// written as stored; the track count comes from file.tracks.
std::vector<std::uint8_t> write_smf(const MidiFile &file);

} // namespace midi
