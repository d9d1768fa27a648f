#pragma once

#include "docs/doc_tree.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace witdocs::wit {

// World resolution rule used for every lookup:
// 1. exact name match;
// 2. otherwise, when the tree holds exactly one world, that world (rendered
//    world names may differ cosmetically from the resolved package's);
// 3. otherwise nullptr.
const docs::WorldDocs* ResolveWorld(const docs::DocTree& tree, std::string_view world_name);

// World-level docs through ResolveWorld. No fallback past the resolved world:
// an exact match without docs yields nullopt.
std::optional<std::string> ResolveWorldDocs(const docs::DocTree& tree,
                                            std::string_view world_name);

// Function docs through ResolveWorld, then the export collection
// (`func_exports`, or the legacy `functions` alias when `func_exports` is
// absent). Export and import lines resolve the same way; `func_imports` is
// only read by the renderers.
std::optional<std::string> ResolveFunctionDocs(const docs::DocTree& tree,
                                               std::string_view world_name,
                                               std::string_view function_name);

// Name of a world declaration line: the second whitespace token, or
// "unknown" when the line has fewer than two tokens.
std::string ExtractWorldName(std::string_view trimmed_line);

// Function name of an `export|import <name>: ...` line: the second
// whitespace token before the first colon. nullopt when the shape differs.
std::optional<std::string> ExtractFunctionName(std::string_view trimmed_line);

// Re-weaves docs from `tree` into a WIT rendering produced elsewhere.
//
// Line scanner with two states (top level, inside a world body); it never
// parses WIT and never fails. `///` lines are inserted right before each
// `world ` line and, inside a world body, before each `export `/`import `
// line, indented like that line. A world body ends at the first line that
// trims to `}`. Every input line is emitted unchanged and newline-terminated.
std::string InjectDocs(std::string_view wit_text, const docs::DocTree& tree);

} // namespace witdocs::wit
