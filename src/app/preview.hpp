// src/app/preview.hpp
// Compact console dump of a decoded MIDI file.
// - Prints the SMF header summary
// - Per track: event count, note count, then every note event with its
//   delta and absolute tick; other events are shown as raw hex

#pragma once
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>

#include "midi/events.hpp"

namespace app {

inline void print_preview(const midi::MidiFile &file,
                          std::ostream &out = std::cout) {
  // Header
  out << "SMF header:\n";
  out << "  format  = " << file.format << "\n";
  out << "  nTracks = " << file.tracks.size() << "\n";
  out << "  PPQN    = " << file.ppqn() << " ticks/qn\n";
  if (!file.header_trailing.empty()) {
    out << "  (+" << file.header_trailing.size() << " extra header bytes)\n";
  }

  for (std::size_t t = 0; t < file.tracks.size(); ++t) {
    const auto &events = file.tracks[t].events;
    std::size_t notes = 0;
    for (const auto &ev : events)
      notes += ev.is_note() ? 1 : 0;

    out << "\nTrack " << (t + 1) << ": " << events.size() << " events, "
        << notes << " notes\n";

    std::uint64_t tick = 0;
    for (const auto &ev : events) {
      tick += ev.delta;
      out << "  tick " << std::setw(8) << tick << " (+" << ev.delta << ")  ";
      if (ev.is_note()) {
        out << (ev.type() == midi::EvType::NoteOn ? "On " : "Off")
            << " ch=" << int(ev.channel()) << " note=" << int(*ev.note)
            << " vel=" << int(ev.velocity.value_or(0)) << "\n";
        continue;
      }
      const auto flags = out.flags();
      out << std::hex << std::setfill('0') << std::setw(2) << int(ev.status);
      for (std::uint8_t b : ev.payload)
        out << ' ' << std::setw(2) << int(b);
      out.flags(flags);
      out << std::setfill(' ') << "\n";
    }
  }
}

} // namespace app
