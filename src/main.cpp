// src/main.cpp
// Command-line MIDI editor: decode a .mid file, apply note edits to one or
// all tracks, write the result to a new file.

#include "app/cli.hpp"
#include "app/edit.hpp"
#include "app/preview.hpp"
#include "io/io.hpp"
#include "midi/errors.hpp"
#include "midi/smf.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);

    const auto bytes = io::read_all(cli.midiPath); // read file into memory
    midi::MidiFile file;
    try {
      file = midi::parse_smf(bytes);
    } catch (const midi::MidiError &ex) {
      throw std::runtime_error("That MIDI file is not supported. " +
                               std::string(ex.what()));
    }

    app::apply_edits(cli, file);

    if (cli.print) {
      app::print_preview(file);
    }

    if (app::should_write(cli)) {
      const auto out = cli.outPath ? *cli.outPath : app::default_output_path();
      io::write_all(out, midi::write_smf(file));
      std::cout << "File saved: " << out.string() << "\n";
    }

    return 0;
  } catch (const app::UsageError &ex) {
    std::cerr << ex.what() << "\n";
    return 2;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
