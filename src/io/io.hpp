// src/io/io.hpp
// Thin I/O façade for whole-file reads and writes.
// main only talks to io::, the byte shuffling lives in common/util.hpp.
//
// Usage:
//   auto bytes = io::read_all(path);   // path: std::filesystem::path or
//   io::write_all(out, bytes);         //       std::string
//
// Throws std::runtime_error on errors (propagated from util.hpp).

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "common/util.hpp"

namespace io {

// Overload: std::string
inline std::vector<std::uint8_t> read_all(const std::string &path) {
  return ::read_all(path);
}

// Overload: std::filesystem::path
inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  return ::read_all(p.string());
}

inline void write_all(const std::filesystem::path &p,
                      const std::vector<std::uint8_t> &bytes) {
  ::write_all(p.string(), bytes);
}

} // namespace io
