#include "wasm/module_reader.hpp"

#include "core/utf8.hpp"
#include "wasm/leb128.hpp"

#include <array>
#include <cstring>
#include <utility>

namespace witdocs::wasm {

namespace {

constexpr std::array<std::uint8_t, 4> kMagic = {0x00, 0x61, 0x73, 0x6D};
constexpr std::array<std::uint8_t, 4> kCoreModuleVersion = {0x01, 0x00, 0x00, 0x00};
constexpr std::array<std::uint8_t, 4> kComponentVersion = {0x0D, 0x00, 0x01, 0x00};

bool Matches(std::span<const std::uint8_t> bytes, std::size_t offset,
             const std::array<std::uint8_t, 4>& expected) {
  return std::memcmp(bytes.data() + offset, expected.data(), expected.size()) == 0;
}

std::string AtOffset(std::size_t offset) {
  return " at offset " + std::to_string(offset);
}

bool ReadCustomName(std::span<const std::uint8_t> bytes, SectionSpan& section,
                    std::string& error) {
  const std::span<const std::uint8_t> payload =
      bytes.subspan(section.payload_offset, section.payload_size);
  std::size_t cursor = 0;
  std::uint32_t name_size = 0;
  if (!ReadVarU32(payload, cursor, name_size)) {
    error = "malformed custom section name length" + AtOffset(section.payload_offset);
    return false;
  }
  if (name_size > payload.size() - cursor) {
    error = "custom section name runs past end of section" + AtOffset(section.payload_offset);
    return false;
  }

  const std::string_view name(reinterpret_cast<const char*>(payload.data() + cursor), name_size);
  if (!core::IsValidUtf8(name)) {
    error = "custom section name is not valid UTF-8" + AtOffset(section.payload_offset + cursor);
    return false;
  }

  section.custom_name = std::string(name);
  section.data_offset = section.payload_offset + cursor + name_size;
  section.data_size = section.payload_size - cursor - name_size;
  return true;
}

} // namespace

const char* ToString(BinaryKind kind) {
  switch (kind) {
  case BinaryKind::kCoreModule:
    return "core_module";
  case BinaryKind::kComponent:
    return "component";
  }
  return "core_module";
}

bool ReadModuleLayout(std::span<const std::uint8_t> bytes, ModuleLayout& layout,
                      std::string& error) {
  layout = ModuleLayout{};

  if (bytes.size() < kHeaderSize) {
    error = "input is too short to be a WebAssembly binary (" + std::to_string(bytes.size()) +
            " bytes)";
    return false;
  }
  if (!Matches(bytes, 0, kMagic)) {
    error = "missing WebAssembly magic header";
    return false;
  }
  if (Matches(bytes, 4, kCoreModuleVersion)) {
    layout.kind = BinaryKind::kCoreModule;
  } else if (Matches(bytes, 4, kComponentVersion)) {
    layout.kind = BinaryKind::kComponent;
  } else {
    error = "unsupported WebAssembly version/layer field" + AtOffset(4);
    return false;
  }

  std::size_t offset = kHeaderSize;
  while (offset < bytes.size()) {
    SectionSpan section;
    section.offset = offset;
    section.id = bytes[offset];

    std::size_t cursor = offset + 1U;
    std::uint32_t payload_size = 0;
    if (!ReadVarU32(bytes, cursor, payload_size)) {
      error = "malformed section size" + AtOffset(offset + 1U);
      return false;
    }
    if (payload_size > bytes.size() - cursor) {
      error = "section " + std::to_string(section.id) + " size " + std::to_string(payload_size) +
              " runs past end of input" + AtOffset(offset);
      return false;
    }

    section.payload_offset = cursor;
    section.payload_size = payload_size;
    section.total_size = (cursor - offset) + payload_size;

    if (section.id == kCustomSectionId && !ReadCustomName(bytes, section, error)) {
      return false;
    }

    offset += section.total_size;
    layout.sections.push_back(std::move(section));
  }

  return true;
}

const SectionSpan* FindCustomSection(const ModuleLayout& layout, std::string_view name) {
  for (const SectionSpan& section : layout.sections) {
    if (section.id == kCustomSectionId && section.custom_name == name) {
      return &section;
    }
  }
  return nullptr;
}

std::span<const std::uint8_t> CustomSectionData(std::span<const std::uint8_t> bytes,
                                                const SectionSpan& section) {
  return bytes.subspan(section.data_offset, section.data_size);
}

} // namespace witdocs::wasm
