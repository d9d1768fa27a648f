#pragma once

#include "wasm/module_reader.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witdocs::wasm {

// What to do with existing top-level custom sections that carry the name being
// appended.
enum class DuplicatePolicy {
  // Keep them; the new section is appended after them.
  kAppend,
  // Drop them, then append the new section.
  kReplace,
};

struct RewriteStats {
  BinaryKind kind = BinaryKind::kCoreModule;
  std::size_t sections_copied = 0;
  std::size_t sections_dropped = 0;
};

// Rebuilds `original` with one extra trailing custom section.
//
// Contract:
// - `original` must frame as a core module or component (see
//   ReadModuleLayout); otherwise returns false and sets `error`.
// - the preamble and every kept section are copied byte-for-byte in their
//   original order, whatever their id or contents.
// - the appended section is `00 <size> <name-len> <name> <data>` with minimal
//   LEB128 encodings.
bool RewriteWithCustomSection(std::span<const std::uint8_t> original, std::string_view name,
                              std::span<const std::uint8_t> data, DuplicatePolicy policy,
                              std::vector<std::uint8_t>& output, std::string& error,
                              RewriteStats* stats = nullptr);

} // namespace witdocs::wasm
