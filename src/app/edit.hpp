// src/app/edit.hpp
// Glue between the parsed command line and the note edits:
//  - which tracks an edit applies to (--track)
//  - running the requested edits in command-line order
//  - whether the result gets written at all
//
// Header-only, like cli.hpp. Throws std::runtime_error for a track that
// does not exist; edit argument errors come from midi/effects.hpp.

#pragma once
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/cli.hpp"
#include "midi/effects.hpp"
#include "midi/events.hpp"

namespace app {

// Tracks the edits apply to: the one picked with --track, or all of them.
inline std::vector<midi::Track *> select_tracks(midi::MidiFile &file,
                                                const Cli &cli) {
  std::vector<midi::Track *> out;
  if (!cli.track) {
    for (auto &t : file.tracks)
      out.push_back(&t);
    return out;
  }
  if (*cli.track >= file.tracks.size()) {
    throw std::runtime_error("Track " + std::to_string(*cli.track + 1) +
                             " does not exist; the file has " +
                             std::to_string(file.tracks.size()) + " track(s)");
  }
  out.push_back(&file.tracks[*cli.track]);
  return out;
}

inline void apply_edit(const Edit &edit, const midi::MidiFile &file,
                       const std::vector<midi::Track *> &tracks,
                       std::ostream &log = std::cout) {
  switch (edit.kind) {
  case EditKind::Pitch:
    midi::shift_pitch(tracks, edit.args.front());
    log << "Pitch shift applied.\n";
    break;
  case EditKind::Velocity:
    midi::set_velocity(tracks, edit.args.front());
    log << "Velocity applied.\n";
    break;
  case EditKind::Chorus:
    midi::add_chorus(tracks, edit.args);
    log << "Chorus added.\n";
    break;
  case EditKind::Delay:
    midi::add_delay(tracks, edit.args, file.ppqn());
    log << "Delay added.\n";
    break;
  }
}

// Select the tracks, then run cli.edits one after the other.
inline void apply_edits(const Cli &cli, midi::MidiFile &file,
                        std::ostream &log = std::cout) {
  const auto tracks = select_tracks(file, cli);
  for (const auto &edit : cli.edits) {
    apply_edit(edit, file, tracks, log);
  }
}

// Output is only written when something was edited or -o was given.
inline bool should_write(const Cli &cli) {
  return !cli.edits.empty() || cli.outPath.has_value();
}

} // namespace app
