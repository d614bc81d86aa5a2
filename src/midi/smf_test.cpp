#include <catch2/catch.hpp>

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include "midi/errors.hpp"
#include "midi/smf.hpp"

using Buf = std::vector<std::uint8_t>;

namespace {

Buf cat(std::initializer_list<Buf> parts) {
  Buf out;
  for (const auto &p : parts)
    out.insert(out.end(), p.begin(), p.end());
  return out;
}

// "MTrk"/"MThd" + BE32 length + body
Buf chunk(const char *tag, const Buf &body) {
  Buf out(tag, tag + 4);
  const auto n = static_cast<std::uint32_t>(body.size());
  out.push_back(static_cast<std::uint8_t>(n >> 24));
  out.push_back(static_cast<std::uint8_t>(n >> 16));
  out.push_back(static_cast<std::uint8_t>(n >> 8));
  out.push_back(static_cast<std::uint8_t>(n));
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

Buf header(std::uint16_t format, std::uint16_t nTracks,
           std::uint16_t division, const Buf &extra = {}) {
  Buf body{std::uint8_t(format >> 8),   std::uint8_t(format),
           std::uint8_t(nTracks >> 8),  std::uint8_t(nTracks),
           std::uint8_t(division >> 8), std::uint8_t(division)};
  body.insert(body.end(), extra.begin(), extra.end());
  return chunk("MThd", body);
}

const Buf kTempo{0x00, 0xFF, 0x51, 0x03, 0x07, 0xA1, 0x20};
const Buf kTimeSig{0x00, 0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08};
const Buf kProgram{0x00, 0xC0, 0x05};
const Buf kNoteOn{0x00, 0x90, 0x3C, 0x64};
const Buf kNoteOff{0x83, 0x60, 0x80, 0x3C, 0x40}; // delta 480
const Buf kEndOfTrack{0x00, 0xFF, 0x2F, 0x00};

midi::ParsedEvent parse_one(const Buf &b) {
  Bytes r(b);
  midi::ParsedEvent p = midi::parse_event(r);
  REQUIRE(r.remaining() == 0);
  return p;
}

} // namespace

TEST_CASE("Note events are interpreted", "[event]") {
  SECTION("note on") {
    const auto p = parse_one(Buf{0x00, 0x90, 0x3C, 0x64});
    CHECK(p.size == 4);
    CHECK(p.event.delta == 0);
    CHECK(p.event.type() == midi::EvType::NoteOn);
    CHECK(p.event.channel() == 0);
    REQUIRE(p.event.note);
    CHECK(*p.event.note == 60);
    CHECK(*p.event.velocity == 100);
    CHECK(p.event.payload.empty());
  }
  SECTION("note off with a two byte delta on channel 3") {
    const auto p = parse_one(Buf{0x81, 0x00, 0x83, 0x3C, 0x00});
    CHECK(p.size == 5);
    CHECK(p.event.delta == 128);
    CHECK(p.event.type() == midi::EvType::NoteOff);
    CHECK(p.event.channel() == 3);
    CHECK(*p.event.note == 60);
    CHECK(*p.event.velocity == 0);
  }
}

TEST_CASE("Other events keep their bytes opaque", "[event]") {
  SECTION("control change") {
    const auto p = parse_one(Buf{0x00, 0xB1, 0x07, 0x64});
    CHECK(p.size == 4);
    CHECK(p.event.type() == midi::EvType::ControlChange);
    CHECK_FALSE(p.event.note);
    CHECK_FALSE(p.event.velocity);
    CHECK(p.event.payload == Buf{0x07, 0x64});
  }
  SECTION("program change") {
    const auto p = parse_one(Buf{0x00, 0xC2, 0x05});
    CHECK(p.size == 3);
    CHECK(p.event.payload == Buf{0x05});
  }
  SECTION("meta event payload includes type and length bytes") {
    const auto p = parse_one(kTempo);
    CHECK(p.size == 7);
    CHECK(p.event.is_meta());
    CHECK(p.event.type() == midi::EvType::System);
    CHECK(p.event.payload == Buf{0x51, 0x03, 0x07, 0xA1, 0x20});
  }
  SECTION("sysex has a length but no meta type byte") {
    const auto p =
        parse_one(Buf{0x00, 0xF0, 0x05, 0x7E, 0x7F, 0x09, 0x01, 0xF7});
    CHECK(p.size == 8);
    CHECK_FALSE(p.event.is_meta());
    CHECK(p.event.payload == Buf{0x05, 0x7E, 0x7F, 0x09, 0x01, 0xF7});
  }
  SECTION("meta event with a two byte length") {
    Buf b{0x00, 0xFF, 0x01, 0x81, 0x48}; // text, 200 bytes
    b.insert(b.end(), 200, 'x');
    const auto p = parse_one(b);
    CHECK(p.size == 205);
    CHECK(p.event.payload.size() == 203);
  }
}

TEST_CASE("Every event class round-trips byte for byte", "[event]") {
  Buf longText{0x00, 0xFF, 0x05, 0x81, 0x00}; // lyric, 128 bytes
  longText.insert(longText.end(), 128, 'a');

  const Buf events[] = {
      kNoteOn,
      kNoteOff,
      Buf{0x40, 0x9F, 0x7F, 0x7F},             // note on, channel 16
      Buf{0x00, 0xA2, 0x3C, 0x20},             // poly aftertouch
      Buf{0x00, 0xB0, 0x40, 0x7F},             // sustain
      Buf{0x00, 0xC9, 0x00},                   // program change
      Buf{0x00, 0xD4, 0x30},                   // channel pressure
      Buf{0x8F, 0x7F, 0xE0, 0x00, 0x40},       // pitch bend, delta 2047
      kTempo,
      kTimeSig,
      kEndOfTrack,
      Buf{0x00, 0xF0, 0x03, 0x43, 0x12, 0xF7}, // sysex
      Buf{0x00, 0xF7, 0x02, 0x01, 0xF7},       // sysex continuation
      Buf{0x00, 0xFF, 0x01, 0x80, 0x02, 'h', 'i'}, // non-minimal length
      longText,
  };
  for (const auto &b : events) {
    INFO("event bytes: " << b.size());
    const auto p = parse_one(b);
    CHECK(p.size == b.size());
    CHECK(midi::serialize_event(p.event) == b);
  }
}

TEST_CASE("Data bytes in status position are rejected", "[event][errors]") {
  for (std::uint8_t status : {0x00, 0x12, 0x3C, 0x64, 0x7F}) {
    INFO("status " << int(status));
    Bytes r(Buf{0x00, status, 0x40, 0x40});
    CHECK_THROWS_AS(midi::parse_event(r), midi::MalformedEventError);
  }
}

TEST_CASE("Events cut short are truncated", "[event][errors]") {
  Bytes note(Buf{0x00, 0x90, 0x3C});
  CHECK_THROWS_AS(midi::parse_event(note), midi::TruncatedStreamError);

  Bytes meta(Buf{0x00, 0xFF, 0x01, 0x05, 'a'});
  CHECK_THROWS_AS(midi::parse_event(meta), midi::TruncatedStreamError);
}

TEST_CASE("Serializer writes stored values without clamping", "[event]") {
  auto p = parse_one(Buf{0x00, 0x90, 0x3C, 0x64});
  p.event.note = 200;
  p.event.velocity = 255;
  p.event.delta = 300;
  CHECK(midi::serialize_event(p.event) == Buf{0x82, 0x2C, 0x90, 200, 255});
}

TEST_CASE("Track declared length matches the events", "[track]") {
  const Buf body = cat({kProgram, kNoteOn, kNoteOff, kEndOfTrack});
  const Buf bytes = chunk("MTrk", body);

  Bytes r(bytes);
  const midi::Track track = midi::parse_track(r);
  CHECK(r.remaining() == 0);
  REQUIRE(track.events.size() == 4);

  std::size_t sum = 0;
  for (const auto &ev : track.events)
    sum += midi::serialize_event(ev).size();
  CHECK(sum == body.size());

  ByteSink w;
  midi::write_track(w, track);
  CHECK(w.data == bytes);
}

TEST_CASE("Track length is recomputed after inserting events", "[track]") {
  Bytes r(chunk("MTrk", cat({kNoteOn, kNoteOff, kEndOfTrack})));
  midi::Track track = midi::parse_track(r);

  midi::Event extra = track.events[0];
  extra.delta = 200; // two byte delta: 5 bytes
  track.events.insert(track.events.begin() + 1, extra);
  extra.delta = 0; // 4 bytes
  track.events.insert(track.events.begin() + 1, extra);

  ByteSink w;
  midi::write_track(w, track);
  const std::size_t expected = kNoteOn.size() + kNoteOff.size() +
                               kEndOfTrack.size() + 5 + 4;
  REQUIRE(w.data.size() == 8 + expected);
  CHECK(w.data[7] == expected);

  Bytes again(w.data);
  CHECK(midi::parse_track(again).events.size() == 5);
}

TEST_CASE("Empty track chunk has no events", "[track]") {
  Bytes r(chunk("MTrk", {}));
  CHECK(midi::parse_track(r).events.empty());
}

TEST_CASE("Malformed tracks are rejected", "[track][errors]") {
  SECTION("wrong chunk id") {
    Bytes r(chunk("MTrx", kEndOfTrack));
    CHECK_THROWS_AS(midi::parse_track(r), midi::MalformedTrackError);
  }
  SECTION("an event runs past the declared length") {
    // Declares 6 bytes: the note on (4) fits, the 5 byte note off does not.
    Buf b = chunk("MTrk", cat({kNoteOn, kNoteOff}));
    b[7] = 6;
    Bytes r(b);
    CHECK_THROWS_AS(midi::parse_track(r), midi::MalformedTrackError);
  }
  SECTION("declared length beyond the data") {
    Buf b = chunk("MTrk", kNoteOn);
    b[7] = 40;
    Bytes r(b);
    CHECK_THROWS_AS(midi::parse_track(r), midi::TruncatedStreamError);
  }
  SECTION("a track error is also a format error") {
    Bytes r(chunk("XXXX", kEndOfTrack));
    CHECK_THROWS_AS(midi::parse_track(r), midi::FormatError);
  }
}

TEST_CASE("Whole file round-trips byte for byte", "[smf]") {
  const Buf file = cat({
      header(1, 3, 480),
      chunk("MTrk", cat({kTempo, kTimeSig, kEndOfTrack})),
      chunk("MTrk", cat({kProgram, Buf{0x00, 0xB0, 0x07, 0x64}, kNoteOn,
                         kNoteOff, Buf{0x00, 0x90, 0x40, 0x50},
                         Buf{0x60, 0x90, 0x40, 0x00}, kEndOfTrack})),
      chunk("MTrk", cat({Buf{0x00, 0xF0, 0x03, 0x43, 0x12, 0xF7},
                         Buf{0x00, 0x99, 0x24, 0x70},
                         Buf{0x30, 0x89, 0x24, 0x00}, kEndOfTrack})),
  });

  const midi::MidiFile smf = midi::parse_smf(file);
  CHECK(smf.format == 1);
  CHECK(smf.ppqn() == 480);
  CHECK(smf.header_length == 6);
  CHECK(smf.header_trailing.empty());
  REQUIRE(smf.tracks.size() == 3);
  CHECK(smf.tracks[0].events.size() == 3);
  CHECK(smf.tracks[1].events.size() == 7);
  CHECK(smf.tracks[2].events.size() == 4);

  CHECK(midi::write_smf(smf) == file);
}

TEST_CASE("Extra header bytes are kept", "[smf]") {
  const Buf file = cat({header(0, 1, 96, Buf{0xAB, 0xCD}),
                        chunk("MTrk", cat({kNoteOn, kEndOfTrack}))});

  const midi::MidiFile smf = midi::parse_smf(file);
  CHECK(smf.header_length == 8);
  CHECK(smf.header_trailing == Buf{0xAB, 0xCD});
  CHECK(smf.ppqn() == 96);
  CHECK(midi::write_smf(smf) == file);
}

TEST_CASE("Track count is taken from the tree when writing", "[smf]") {
  midi::MidiFile smf = midi::parse_smf(
      cat({header(1, 1, 480), chunk("MTrk", kEndOfTrack)}));
  smf.tracks.push_back(smf.tracks.front());

  const Buf out = midi::write_smf(smf);
  CHECK(out[10] == 0x00);
  CHECK(out[11] == 0x02);
  CHECK(midi::parse_smf(out).tracks.size() == 2);
}

TEST_CASE("Bad files are rejected", "[smf][errors]") {
  const Buf track = chunk("MTrk", kEndOfTrack);

  SECTION("not a MIDI file") {
    Buf b = cat({header(0, 1, 480), track});
    b[0] = 'X', b[1] = 'Y', b[2] = 'Z', b[3] = 'Z';
    CHECK_THROWS_AS(midi::parse_smf(b), midi::FormatError);
  }
  SECTION("header shorter than 6 bytes") {
    Buf b = cat({header(0, 1, 480), track});
    b[7] = 5;
    CHECK_THROWS_AS(midi::parse_smf(b), midi::FormatError);
  }
  SECTION("SMPTE division") {
    const Buf b = cat({header(0, 1, 0xE728), track}); // -25 fps, 40 sub
    CHECK_THROWS_AS(midi::parse_smf(b), midi::UnsupportedTimingError);
  }
  SECTION("header cut short") {
    const Buf b{'M', 'T', 'h', 'd', 0, 0, 0, 6, 0, 1};
    CHECK_THROWS_AS(midi::parse_smf(b), midi::TruncatedStreamError);
  }
  SECTION("fewer tracks than announced") {
    const Buf b = cat({header(1, 2, 480), track});
    CHECK_THROWS_AS(midi::parse_smf(b), midi::TruncatedStreamError);
  }
  SECTION("running status inside a track") {
    const Buf b = cat({header(0, 1, 480),
                       chunk("MTrk", cat({kNoteOn, Buf{0x10, 0x3E, 0x64},
                                          kEndOfTrack}))});
    CHECK_THROWS_AS(midi::parse_smf(b), midi::MalformedEventError);
  }
  SECTION("all codec errors are runtime errors") {
    Buf b = cat({header(0, 1, 480), track});
    b[0] = 'X';
    CHECK_THROWS_AS(midi::parse_smf(b), std::runtime_error);
  }
}
