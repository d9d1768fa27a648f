#ifndef WITDOCS_CORE_UTF8_HPP_
#define WITDOCS_CORE_UTF8_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace witdocs::core {

// Strict UTF-8 validation: rejects overlong forms, surrogates and scalars past
// U+10FFFF. On failure `bad_offset` points at the first offending byte.
inline bool IsValidUtf8(std::string_view text, std::size_t* bad_offset = nullptr) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<std::uint8_t>(text[i]);
    std::size_t extra = 0;
    std::uint32_t min_scalar = 0;
    std::uint32_t scalar = 0;

    if (lead < 0x80U) {
      ++i;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      extra = 1;
      min_scalar = 0x80U;
      scalar = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      extra = 2;
      min_scalar = 0x800U;
      scalar = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      extra = 3;
      min_scalar = 0x10000U;
      scalar = lead & 0x07U;
    } else {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }

    if (i + extra >= text.size()) {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<std::uint8_t>(text[i + k]);
      if ((cont & 0xC0U) != 0x80U) {
        if (bad_offset != nullptr) {
          *bad_offset = i;
        }
        return false;
      }
      scalar = (scalar << 6) | (cont & 0x3FU);
    }

    if (scalar < min_scalar || scalar > 0x10FFFFU || (scalar >= 0xD800U && scalar <= 0xDFFFU)) {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }
    i += extra + 1U;
  }
  return true;
}

} // namespace witdocs::core

#endif // WITDOCS_CORE_UTF8_HPP_
