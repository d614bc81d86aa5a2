// src/midi/smf.cpp
// Decode/encode a Standard MIDI File (SMF) to/from midi::MidiFile.
// Pure codec: no printing, no I/O. Event-level work lives in event.cpp.

#include "midi/smf.hpp"
#include "common/reader.hpp"
#include "common/writer.hpp"
#include "midi/errors.hpp"
#include "midi/events.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864; // "MThd"
constexpr std::uint32_t kMTrk = 0x4D54726B; // "MTrk"

std::string tag_name(std::uint32_t id) {
  std::string s;
  for (int shift = 24; shift >= 0; shift -= 8) {
    const char c = static_cast<char>((id >> shift) & 0xFF);
    s += (c >= 0x20 && c < 0x7F) ? c : '?';
  }
  return s;
}

// Parse SMF header (MThd chunk) into `file`, leaving the cursor on the first
// track chunk. Returns the announced track count.
std::uint16_t parse_header(Bytes &r, midi::MidiFile &file) {
  const std::uint32_t id = r.be32();
  if (id != kMThd) {
    throw midi::FormatError("Not a MIDI file (expected 'MThd', found '" +
                            tag_name(id) + "')");
  }

  file.header_length = r.be32();
  if (file.header_length < 6) {
    throw midi::FormatError("Header chunk length must be at least 6, got " +
                            std::to_string(file.header_length));
  }

  file.format = r.be16();
  const std::uint16_t nTracks = r.be16();
  file.division = r.be16();

  if (file.division & 0x8000) {
    // SMPTE timing (negative fps in the high byte, subframes in the low byte)
    std::ostringstream oss;
    oss << "SMPTE time division is not supported ("
        << 256 - ((file.division >> 8) & 0xFF) << " fps, "
        << (file.division & 0xFF)
        << " subframes); only ticks per quarter note timing is";
    throw midi::UnsupportedTimingError(oss.str());
  }

  // Some writers pad the header; keep whatever is there.
  file.header_trailing = r.take(file.header_length - 6);
  return nTracks;
}

} // namespace

namespace midi {

Track parse_track(Bytes &r) {
  const std::size_t start = r.off;
  const std::uint32_t id = r.be32();
  if (id != kMTrk) {
    throw MalformedTrackError("Missing 'MTrk' chunk at offset " +
                              std::to_string(start) + " (found '" +
                              tag_name(id) + "')");
  }
  const std::uint32_t len = r.be32();

  // Count the declared length down with each event's size. An event that
  // does not fit in what is left means the length and the events disagree.
  Track track;
  std::size_t remaining = len;
  while (remaining != 0) {
    const std::size_t at = r.off;
    ParsedEvent p = parse_event(r);
    if (p.size > remaining) {
      throw MalformedTrackError(
          "Event at offset " + std::to_string(at) + " (" +
          std::to_string(p.size) + " bytes) overruns track length " +
          std::to_string(len) + " by " + std::to_string(p.size - remaining) +
          " bytes");
    }
    remaining -= p.size;
    track.events.push_back(std::move(p.event));
  }
  return track;
}

void write_track(ByteSink &w, const Track &track) {
  ByteSink body;
  for (const Event &ev : track.events) {
    write_event(body, ev);
  }

  w.tag("MTrk");
  w.be32(static_cast<std::uint32_t>(body.data.size()));
  w.append(body.data);
}

MidiFile parse_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  MidiFile file;
  const std::uint16_t nTracks = parse_header(r, file);

  file.tracks.reserve(nTracks);
  for (std::uint16_t i = 0; i < nTracks; ++i) {
    file.tracks.push_back(parse_track(r));
  }
  return file;
}

std::vector<std::uint8_t> write_smf(const MidiFile &file) {
  ByteSink w;
  w.tag("MThd");
  w.be32(file.header_length);
  w.be16(file.format);
  w.be16(static_cast<std::uint16_t>(file.tracks.size()));
  w.be16(file.division);
  w.append(file.header_trailing);

  for (const Track &track : file.tracks) {
    write_track(w, track);
  }
  return w.data;
}

} // namespace midi
