#pragma once

#include "core/json_dom.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace witdocs::docs {

// Documentation attached to one function. Payloads may carry more fields
// (stability, etc.); they are tolerated on decode and survive only through
// `DocTree::document`.
struct FuncDocs {
  std::optional<std::string> docs;

  bool operator==(const FuncDocs&) const = default;
};

using FuncDocsMap = std::map<std::string, FuncDocs>;

// Per-world documentation.
//
// `func_exports` and its legacy alias `functions` are kept apart because
// lookups treat them as alternatives rather than merging them. Absence of a
// collection (nullopt) differs from an empty one: a present `func_exports`
// shadows `functions` entirely.
struct WorldDocs {
  std::optional<std::string> docs;
  std::optional<FuncDocsMap> func_exports;
  std::optional<FuncDocsMap> functions;
  FuncDocsMap func_imports;

  bool operator==(const WorldDocs&) const = default;
};

// In-memory form of the `package-docs` payload. Immutable once built; the
// renderers and the WIT injector only read it.
struct DocTree {
  std::optional<std::string> docs;
  std::map<std::string, WorldDocs> worlds;

  // Full JSON document this tree was decoded from, unknown fields included.
  // Null for trees assembled in memory (e.g. from a .wit scan).
  core::json::Value document;
};

// Equality over the documentation content only; `document` is a carrier for
// pass-through output and does not take part.
bool operator==(const DocTree& lhs, const DocTree& rhs);

// Builds a tree from a decoded JSON document.
//
// Contract:
// - root must be an object; `worlds` is optional but must be an object when
//   present, and so must every world and function entry.
// - a `docs` field must be a string or null; null means "no documentation".
// - unknown fields anywhere are ignored.
// - on success `tree.document` holds a copy of `root`.
bool DocTreeFromJson(const core::json::Value& root, DocTree& tree, std::string& error);

// Canonical JSON form of the documentation content (ignores `document`).
core::json::Value DocTreeToJson(const DocTree& tree);

// JSON to embed or print for this tree: the original document when the tree
// was decoded from one, the canonical form otherwise.
core::json::Value DocumentOf(const DocTree& tree);

// Returns the exported-function collection, honoring the legacy alias:
// `func_exports` when present, else `functions`, else nullptr.
const FuncDocsMap* ExportedFunctions(const WorldDocs& world);

} // namespace witdocs::docs
