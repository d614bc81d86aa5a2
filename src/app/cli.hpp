// src/app/cli.hpp
// Minimal, robust CLI parsing for our tiny main.
// Responsibilities:
//  - Extract the positional MIDI path and check it looks like a .mid file.
//  - Pick the tracks to edit (--track <n|all>).
//  - Collect the edits to apply, in command-line order.
//  - Decide where (and whether) to write the result.
//
// Design notes:
//  * Header-only, like the rest of app/.
//  * We throw std::runtime_error on problems; main() catches and prints.
//    Mistakes in the shape of the command line itself (no arguments, --help,
//    unknown flag, missing value) throw app::UsageError, which main() turns
//    into exit code 2.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.midiPath  --> std::filesystem::path to the .mid file
//   cli.track     --> std::optional<std::size_t>, 0-based; empty = all tracks
//   cli.edits     --> std::vector<app::Edit>
//   cli.outPath   --> std::optional<std::filesystem::path>

#pragma once
#include <cstddef>
#include <ctime>
#include <exception>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace app {

// The command line cannot be understood; what() includes the usage text.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

enum class EditKind { Pitch, Velocity, Chorus, Delay };

// One requested edit and its integer arguments.
struct Edit {
  EditKind kind;
  std::vector<int> args;
};

struct Cli {
  std::filesystem::path midiPath;
  std::optional<std::size_t> track; // 0-based; empty means "all tracks"
  std::vector<Edit> edits;          // applied in this order
  std::optional<std::filesystem::path> outPath; // from -o/--out, if given
  bool print = false;                           // --print
};

inline std::string usage(const char *argv0) {
  return "Usage:\n  " + std::string(argv0) +
         " <file.mid> [options]\n"
         "Options:\n"
         "  --track <n|all>       Track to edit, 1-based (default: all)\n"
         "  --pitch <semitones>   Shift notes up/down, e.g. 12 or -12\n"
         "  --velocity <1..127>   Set the velocity of every sounding note\n"
         "  --chorus <i,j,...>    Add notes at these intervals, e.g. 4,7\n"
         "  --delay <n,m,...>     Repeat notes n, m sixteenths later\n"
         "  -o, --out <path>      Output file (default: output-<time>.mid)\n"
         "  --print               Dump the (edited) file to stdout\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

// Parse a whole string as a signed integer; `what` names it in errors.
inline int parse_int(const std::string &s, const std::string &what) {
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(s, &used);
  } catch (const std::exception &) {
    throw std::runtime_error("Invalid " + what + ": '" + s + "'");
  }
  if (used != s.size()) {
    throw std::runtime_error("Invalid " + what + ": '" + s + "'");
  }
  return v;
}

// "4, 7,-12" -> {4, 7, -12}. Empty items are errors.
inline std::vector<int> parse_int_list(const std::string &s,
                                       const std::string &what) {
  std::vector<int> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    const auto e = item.find_last_not_of(" \t");
    if (b == std::string::npos) {
      throw std::runtime_error("Empty entry in " + what + " list: '" + s +
                               "'");
    }
    out.push_back(parse_int(item.substr(b, e - b + 1), what));
  }
  if (out.empty()) {
    throw std::runtime_error("Empty " + what + " list");
  }
  return out;
}

// output-<unix seconds>.mid in the current directory.
inline std::filesystem::path default_output_path() {
  const auto now = static_cast<long long>(std::time(nullptr));
  return "output-" + std::to_string(now) + ".mid";
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the MIDI file path (positional), ending in .mid.
//  - Options as listed in usage().
//  - Throws UsageError for --help and malformed command lines, and
//    std::runtime_error for bad values or a missing file.
inline Cli parse_cli(int argc, char **argv) {
  if (argc < 2) {
    throw UsageError(usage(argv[0]));
  }

  // 1) Positional MIDI path
  const std::string first = argv[1];
  if (first == "--help" || first == "-h") {
    throw UsageError(usage(argv[0]));
  }
  if (is_flag_like(first)) {
    throw UsageError("First argument must be a MIDI file path, not a flag.\n" +
                     usage(argv[0]));
  }
  std::filesystem::path midiPath = first;
  if (midiPath.extension().string() != ".mid") {
    throw std::runtime_error("Expected a .mid file, got: " +
                             midiPath.string());
  }
  if (!std::filesystem::exists(midiPath) ||
      !std::filesystem::is_regular_file(midiPath)) {
    throw std::runtime_error("MIDI file not found: " + midiPath.string());
  }

  // 2) Optional flags
  Cli cli;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw UsageError(a + " requires a value\n" + usage(argv[0]));
      }
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      throw UsageError(usage(argv[0]));
    } else if (a == "--track") {
      const std::string v = value();
      if (v == "all") {
        cli.track.reset();
      } else {
        const int n = parse_int(v, "track number");
        if (n < 1) {
          throw std::runtime_error("Track numbers start at 1, got " + v);
        }
        cli.track = static_cast<std::size_t>(n - 1);
      }
    } else if (a == "--pitch") {
      cli.edits.push_back(
          Edit{EditKind::Pitch, {parse_int(value(), "pitch amount")}});
    } else if (a == "--velocity") {
      const int v = parse_int(value(), "velocity");
      if (v < 1 || v > 127) {
        throw std::runtime_error("The velocity value must be between 1 and "
                                 "127.");
      }
      cli.edits.push_back(Edit{EditKind::Velocity, {v}});
    } else if (a == "--chorus") {
      cli.edits.push_back(
          Edit{EditKind::Chorus, parse_int_list(value(), "chorus interval")});
    } else if (a == "--delay") {
      std::vector<int> d = parse_int_list(value(), "delay");
      for (int n : d) {
        if (n < 1) {
          throw std::runtime_error("Delays are counted in sixteenth notes and "
                                   "must be at least 1, got " +
                                   std::to_string(n));
        }
      }
      cli.edits.push_back(Edit{EditKind::Delay, std::move(d)});
    } else if (a == "-o" || a == "--out") {
      cli.outPath = std::filesystem::path(value());
    } else if (a == "--print") {
      cli.print = true;
    } else {
      // Unknown flags are errors rather than silently ignored.
      throw UsageError("Unknown option: " + a + "\n" + usage(argv[0]));
    }
  }

  // 3) Return the parsed/validated CLI
  cli.midiPath = std::filesystem::canonical(midiPath); // nice absolute path
  return cli;
}

} // namespace app
