#ifndef WITDOCS_WASM_LEB128_HPP_
#define WITDOCS_WASM_LEB128_HPP_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace witdocs::wasm {

// Unsigned LEB128 (u32) as used for section sizes and name lengths.
//
// Decoding rejects encodings longer than 5 bytes and a 5th byte that carries
// bits past bit 31. Non-minimal encodings within those limits are accepted;
// callers that copy sections keep the original bytes, so such encodings are
// reproduced as-is.
inline bool ReadVarU32(std::span<const std::uint8_t> bytes, std::size_t& offset,
                       std::uint32_t& value) {
  value = 0;
  for (unsigned shift = 0; shift < 35U; shift += 7U) {
    if (offset >= bytes.size()) {
      return false;
    }
    const std::uint8_t byte = bytes[offset++];
    if (shift == 28U && (byte & 0x70U) != 0U) {
      return false;
    }
    value |= static_cast<std::uint32_t>(byte & 0x7FU) << shift;
    if ((byte & 0x80U) == 0U) {
      return true;
    }
  }
  return false;
}

// Minimal-length encoding.
inline void AppendVarU32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  do {
    std::uint8_t byte = static_cast<std::uint8_t>(value & 0x7FU);
    value >>= 7;
    if (value != 0U) {
      byte |= 0x80U;
    }
    out.push_back(byte);
  } while (value != 0U);
}

inline std::size_t VarU32Size(std::uint32_t value) {
  std::size_t size = 1;
  while (value >= 0x80U) {
    value >>= 7;
    ++size;
  }
  return size;
}

} // namespace witdocs::wasm

#endif // WITDOCS_WASM_LEB128_HPP_
