// src/midi/effects.hpp
// Note-level edits applied to a selection of tracks.
//
// All of these only touch note events (events with `note` set) and leave
// every other event alone. Inserted events are copies of an existing note
// event, so they keep its status byte (type + channel).
//
// Argument errors throw std::invalid_argument before anything is modified.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Move every note by `semitones` (negative lowers). Results are clamped to
// the MIDI range 0..127.
void shift_pitch(const std::vector<Track *> &tracks, int semitones);

// Give every note event with a non-zero velocity the velocity `velocity`
// (1..127). Note On with velocity 0 means Note Off and is kept as is.
void set_velocity(const std::vector<Track *> &tracks, int velocity);

// After every note event insert one copy per interval (in semitones, clamped
// to 0..127) with delta 0, so the copies sound together with the original.
// Each copy goes right after the source event, which leaves the copies in
// reverse order of `intervals`.
void add_chorus(const std::vector<Track *> &tracks,
                const std::vector<int> &intervals);

// For every note event and every entry of `sixteenths` (>= 1) insert a copy
// that many sixteenth notes later (ppqn * n / 4 ticks, rounded down). The
// copy is placed before the first following event it precedes in time and
// that event's delta is reduced accordingly; past the end of the track it
// is appended.
void add_delay(const std::vector<Track *> &tracks,
               const std::vector<int> &sixteenths, unsigned ppqn);

} // namespace midi
