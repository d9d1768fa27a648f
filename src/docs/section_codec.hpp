#pragma once

#include "docs/doc_tree.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace witdocs::docs {

// Name of the custom section this project owns.
inline constexpr std::string_view kDocsSectionName = "package-docs";

// Version byte written in front of the JSON payload. Decoders skip it without
// checking so later payload revisions still frame correctly.
inline constexpr std::uint8_t kDocsPayloadVersion = 1;

// Serializes `tree` as `[version byte][compact UTF-8 JSON]`.
//
// Trees decoded from a payload re-encode their full original document so
// fields this project does not model survive re-injection.
bool EncodeDocsPayload(const DocTree& tree, std::vector<std::uint8_t>& payload,
                       std::string& error);

// Decodes a `package-docs` section body.
//
// Contract:
// - payloads of 0 or 1 bytes carry no documentation: returns true and leaves
//   `tree` empty (nullopt).
// - otherwise the bytes after the version byte must be UTF-8 JSON matching
//   the DocTree schema; returns false and sets `error` when they are not.
bool DecodeDocsPayload(std::span<const std::uint8_t> payload, std::optional<DocTree>& tree,
                       std::string& error);

// Result of looking for documentation inside a module binary.
struct ExtractResult {
  bool section_found = false;
  std::optional<DocTree> tree;
};

// Scans `module_bytes` for the first `package-docs` custom section and decodes
// it. A missing section is not an error (`section_found` stays false); framing
// or payload problems are.
bool ExtractDocTree(std::span<const std::uint8_t> module_bytes, ExtractResult& result,
                    std::string& error);

} // namespace witdocs::docs
