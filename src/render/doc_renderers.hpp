#pragma once

#include "docs/doc_tree.hpp"

#include <ostream>
#include <string>

namespace witdocs::render {

// Display-time toggles; they never change the tree.
struct DisplayFilter {
  // Suppress world headings, world docs and section headings.
  bool functions_only = false;
  // Suppress function listings.
  bool worlds_only = false;
};

inline constexpr const char* kNoDocsPlaceholder = "(no documentation)";
inline constexpr const char* kNoWorldsMessage = "No world documentation found";

// Pretty-printed JSON of the tree's document, unknown fields included.
// Fails only when the document holds values JSON cannot encode.
bool RenderStructured(const docs::DocTree& tree, std::ostream& out, std::string& error);

// Terminal-oriented listing: one block per world, one line per function.
void RenderPlain(const docs::DocTree& tree, const DisplayFilter& filter, std::ostream& out);

// Markdown: `# World:` per world, `## Exported/Imported Functions`, and a
// `###` heading per function.
void RenderMarkdown(const docs::DocTree& tree, const DisplayFilter& filter, std::ostream& out);

} // namespace witdocs::render
