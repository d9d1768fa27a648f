#include "wasm/module_rewriter.hpp"

#include "wasm/leb128.hpp"
#include "wasm/module_reader.hpp"

#include <limits>
#include <utility>

namespace witdocs::wasm {

namespace {

void AppendSpan(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

bool AppendCustomSection(std::vector<std::uint8_t>& out, std::string_view name,
                         std::span<const std::uint8_t> data, std::string& error) {
  constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();
  if (name.size() > kMaxU32) {
    error = "custom section name is too long";
    return false;
  }

  const auto name_size = static_cast<std::uint32_t>(name.size());
  const std::uint64_t payload_size =
      static_cast<std::uint64_t>(VarU32Size(name_size)) + name.size() + data.size();
  if (payload_size > kMaxU32) {
    error = "custom section '" + std::string(name) + "' exceeds the 4 GiB section limit";
    return false;
  }

  out.push_back(kCustomSectionId);
  AppendVarU32(out, static_cast<std::uint32_t>(payload_size));
  AppendVarU32(out, name_size);
  out.insert(out.end(), name.begin(), name.end());
  AppendSpan(out, data);
  return true;
}

} // namespace

bool RewriteWithCustomSection(std::span<const std::uint8_t> original, std::string_view name,
                              std::span<const std::uint8_t> data, DuplicatePolicy policy,
                              std::vector<std::uint8_t>& output, std::string& error,
                              RewriteStats* stats) {
  ModuleLayout layout;
  if (!ReadModuleLayout(original, layout, error)) {
    error = "input is not a structurally valid WebAssembly binary: " + error;
    return false;
  }

  RewriteStats local_stats;
  local_stats.kind = layout.kind;
  std::vector<std::uint8_t> rebuilt;
  rebuilt.reserve(original.size() + name.size() + data.size() + 16U);
  AppendSpan(rebuilt, original.first(kHeaderSize));

  for (const SectionSpan& section : layout.sections) {
    if (policy == DuplicatePolicy::kReplace && section.id == kCustomSectionId &&
        section.custom_name == name) {
      ++local_stats.sections_dropped;
      continue;
    }
    AppendSpan(rebuilt, original.subspan(section.offset, section.total_size));
    ++local_stats.sections_copied;
  }

  if (!AppendCustomSection(rebuilt, name, data, error)) {
    return false;
  }

  output = std::move(rebuilt);
  if (stats != nullptr) {
    *stats = local_stats;
  }
  return true;
}

} // namespace witdocs::wasm
