// src/midi/effects.cpp
// Implementation of the note edits.

#include "midi/effects.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Note plus offset, clamped to 0..127. Summed in long long so offsets near
// INT_MIN / INT_MAX cannot overflow.
std::uint8_t offset_note(std::uint8_t note, int offset) {
  const long long sum = static_cast<long long>(note) + offset;
  return static_cast<std::uint8_t>(std::clamp(sum, 0LL, 127LL));
}

} // namespace

namespace midi {

void shift_pitch(const std::vector<Track *> &tracks, int semitones) {
  for (Track *track : tracks) {
    for (Event &ev : track->events) {
      if (!ev.note)
        continue;
      ev.note = offset_note(*ev.note, semitones);
    }
  }
}

void set_velocity(const std::vector<Track *> &tracks, int velocity) {
  if (velocity < 1 || velocity > 127) {
    throw std::invalid_argument("Velocity must be between 1 and 127, got " +
                                std::to_string(velocity));
  }
  for (Track *track : tracks) {
    for (Event &ev : track->events) {
      if (!ev.velocity || *ev.velocity == 0)
        continue;
      ev.velocity = static_cast<std::uint8_t>(velocity);
    }
  }
}

void add_chorus(const std::vector<Track *> &tracks,
                const std::vector<int> &intervals) {
  for (Track *track : tracks) {
    auto &events = track->events;
    // Back to front so insertions don't shift events still to be visited.
    for (std::size_t idx = events.size(); idx-- > 0;) {
      if (!events[idx].note)
        continue;
      const Event source = events[idx];
      for (int interval : intervals) {
        Event copy = source;
        copy.delta = 0;
        copy.note = offset_note(*source.note, interval);
        events.insert(events.begin() + idx + 1, copy);
      }
    }
  }
}

void add_delay(const std::vector<Track *> &tracks,
               const std::vector<int> &sixteenths, unsigned ppqn) {
  std::vector<std::uint64_t> offsets;
  offsets.reserve(sixteenths.size());
  for (int n : sixteenths) {
    if (n < 1) {
      throw std::invalid_argument(
          "Delay must be at least one sixteenth note, got " +
          std::to_string(n));
    }
    offsets.push_back(std::uint64_t(ppqn) * std::uint64_t(n) / 4);
  }

  for (Track *track : tracks) {
    auto &events = track->events;
    for (std::size_t idx = events.size(); idx-- > 0;) {
      if (!events[idx].note)
        continue;
      const Event source = events[idx];
      for (std::uint64_t ticks : offsets) {
        // Walk forward until the next event lies beyond the delay.
        std::size_t pos = idx + 1;
        while (pos < events.size() && events[pos].delta <= ticks) {
          ticks -= events[pos].delta;
          ++pos;
        }

        Event copy = source;
        copy.delta = ticks;
        if (pos < events.size())
          events[pos].delta -= ticks; // keep the following event in place
        events.insert(events.begin() + pos, copy);
      }
    }
  }
}

} // namespace midi
