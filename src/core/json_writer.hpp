#ifndef WITDOCS_CORE_JSON_WRITER_HPP_
#define WITDOCS_CORE_JSON_WRITER_HPP_

#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace witdocs::core::json {

enum class WriteStyle {
  kCompact,
  kPretty,
};

// String escaping shared by every JSON emitter. Non-ASCII UTF-8 passes through
// untouched; only quotes, backslashes and control characters are escaped.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

namespace detail {

inline bool WriteNumber(double number, std::string& out, std::string& error) {
  if (!std::isfinite(number)) {
    error = "cannot encode non-finite number as JSON";
    return false;
  }

  // Integral values print without a fraction.
  if (std::floor(number) == number && std::fabs(number) < 9.007199254740992e15) {
    out += std::to_string(static_cast<std::int64_t>(number));
    return true;
  }

  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (result.ec != std::errc()) {
    error = "failed to format JSON number";
    return false;
  }
  out.append(buffer, result.ptr);
  return true;
}

inline void NewLine(WriteStyle style, std::size_t depth, std::string& out) {
  if (style == WriteStyle::kCompact) {
    return;
  }
  out.push_back('\n');
  out.append(depth * 2U, ' ');
}

inline bool WriteValue(const Value& value, WriteStyle style, std::size_t depth, std::string& out,
                       std::string& error) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return true;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return true;
  case Value::Type::kNumber:
    if (!value.number_text.empty()) {
      out += value.number_text;
      return true;
    }
    return WriteNumber(value.number_value, out, error);
  case Value::Type::kString:
    out += '"' + EscapeJson(value.string_value) + '"';
    return true;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return true;
    }
    out.push_back('[');
    bool first = true;
    for (const Value& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      NewLine(style, depth + 1U, out);
      if (!WriteValue(item, style, depth + 1U, out, error)) {
        return false;
      }
    }
    NewLine(style, depth, out);
    out.push_back(']');
    return true;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return true;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      NewLine(style, depth + 1U, out);
      out += '"' + EscapeJson(key) + '"';
      out += style == WriteStyle::kPretty ? ": " : ":";
      if (!WriteValue(item, style, depth + 1U, out, error)) {
        return false;
      }
    }
    NewLine(style, depth, out);
    out.push_back('}');
    return true;
  }
  }

  error = "unknown JSON value type";
  return false;
}

} // namespace detail

// Serializes `value` into `out`. Pretty output uses two-space indentation and
// no trailing newline. Fails only for values JSON cannot represent (NaN/Inf).
inline bool Write(const Value& value, WriteStyle style, std::string& out, std::string& error) {
  out.clear();
  return detail::WriteValue(value, style, 0, out, error);
}

} // namespace witdocs::core::json

#endif // WITDOCS_CORE_JSON_WRITER_HPP_
