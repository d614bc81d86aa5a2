// src/midi/errors.hpp
// Exceptions thrown by the SMF codec.
// Everything derives from midi::MidiError (a std::runtime_error), so callers
// that only want a message can catch std::runtime_error like before.
//
//   MidiError
//   ├── FormatError             bad chunk id, header shorter than 6 bytes
//   │   └── MalformedTrackError bad 'MTrk' id, event overruns track length
//   ├── UnsupportedTimingError  SMPTE division (only PPQN is supported)
//   ├── MalformedEventError     unknown status nibble / running status
//   └── TruncatedStreamError    input ends before a declared length

#pragma once
#include <stdexcept>
#include <string>

namespace midi {

struct MidiError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct FormatError : MidiError {
  using MidiError::MidiError;
};

struct MalformedTrackError : FormatError {
  using FormatError::FormatError;
};

struct UnsupportedTimingError : MidiError {
  using MidiError::MidiError;
};

struct MalformedEventError : MidiError {
  using MidiError::MidiError;
};

struct TruncatedStreamError : MidiError {
  using MidiError::MidiError;
};

} // namespace midi
