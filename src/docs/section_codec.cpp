#include "docs/section_codec.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"
#include "core/utf8.hpp"
#include "wasm/module_reader.hpp"

#include <utility>

namespace witdocs::docs {

bool EncodeDocsPayload(const DocTree& tree, std::vector<std::uint8_t>& payload,
                       std::string& error) {
  std::string json_text;
  if (!core::json::Write(DocumentOf(tree), core::json::WriteStyle::kCompact, json_text, error)) {
    error = "failed to encode package-docs JSON: " + error;
    return false;
  }

  payload.clear();
  payload.reserve(json_text.size() + 1U);
  payload.push_back(kDocsPayloadVersion);
  payload.insert(payload.end(), json_text.begin(), json_text.end());
  return true;
}

bool DecodeDocsPayload(std::span<const std::uint8_t> payload, std::optional<DocTree>& tree,
                       std::string& error) {
  tree.reset();
  if (payload.size() <= 1U) {
    return true;
  }

  const std::span<const std::uint8_t> body = payload.subspan(1);
  const std::string_view json_text(reinterpret_cast<const char*>(body.data()), body.size());

  std::size_t bad_offset = 0;
  if (!core::IsValidUtf8(json_text, &bad_offset)) {
    error = "package-docs payload is not valid UTF-8 (byte " + std::to_string(bad_offset + 1U) +
            ")";
    return false;
  }

  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "failed to parse package-docs JSON: " + error;
    return false;
  }

  DocTree decoded;
  if (!DocTreeFromJson(root, decoded, error)) {
    error = "package-docs JSON does not match the docs schema: " + error;
    return false;
  }
  tree = std::move(decoded);
  return true;
}

bool ExtractDocTree(std::span<const std::uint8_t> module_bytes, ExtractResult& result,
                    std::string& error) {
  result = ExtractResult{};

  wasm::ModuleLayout layout;
  if (!wasm::ReadModuleLayout(module_bytes, layout, error)) {
    error = "failed to parse WebAssembly binary: " + error;
    return false;
  }

  const wasm::SectionSpan* section = wasm::FindCustomSection(layout, kDocsSectionName);
  if (section == nullptr) {
    return true;
  }

  result.section_found = true;
  return DecodeDocsPayload(wasm::CustomSectionData(module_bytes, *section), result.tree, error);
}

} // namespace witdocs::docs
