#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witdocs::wasm {

inline constexpr std::uint8_t kCustomSectionId = 0;
inline constexpr std::size_t kHeaderSize = 8;

enum class BinaryKind {
  kCoreModule,
  kComponent,
};

const char* ToString(BinaryKind kind);

// One top-level section, located by byte offsets into the scanned buffer.
// `offset`/`total_size` cover the id byte, the size field and the payload, so
// `bytes.subspan(offset, total_size)` is the section exactly as stored.
struct SectionSpan {
  std::uint8_t id = 0;
  std::size_t offset = 0;
  std::size_t total_size = 0;
  std::size_t payload_offset = 0;
  std::size_t payload_size = 0;

  // Custom sections only (id 0).
  std::string custom_name;
  std::size_t data_offset = 0;
  std::size_t data_size = 0;
};

// Structural view of a core module or component binary. Nothing inside a
// section payload is interpreted except custom-section names; nested modules
// and components are opaque payloads of their enclosing section.
struct ModuleLayout {
  BinaryKind kind = BinaryKind::kCoreModule;
  std::vector<SectionSpan> sections;
};

// Validates the 8-byte preamble and the framing of every top-level section.
//
// Contract:
// - accepts `\0asm` followed by `01 00 00 00` (core module) or
//   `0d 00 01 00` (component).
// - every section must fit inside the buffer and custom-section names must be
//   valid UTF-8 that fits inside their section.
// - returns false and sets `error` (with the failing byte offset) otherwise.
bool ReadModuleLayout(std::span<const std::uint8_t> bytes, ModuleLayout& layout,
                      std::string& error);

// First custom section named `name`, in stored order, or nullptr. Later
// sections with the same name are ignored.
const SectionSpan* FindCustomSection(const ModuleLayout& layout, std::string_view name);

// Data bytes (after the name) of a custom section within `bytes`.
std::span<const std::uint8_t> CustomSectionData(std::span<const std::uint8_t> bytes,
                                                const SectionSpan& section);

} // namespace witdocs::wasm
