#include "render/doc_renderers.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"

#include <vector>

namespace witdocs::render {

namespace {

struct FunctionSection {
  const docs::FuncDocsMap* functions = nullptr;
  const char* plain_heading = "";
  const char* markdown_heading = "";
};

std::vector<FunctionSection> FunctionSectionsOf(const docs::WorldDocs& world) {
  return {
      {docs::ExportedFunctions(world), "📤 Exported Functions:", "## Exported Functions"},
      {&world.func_imports, "📥 Imported Functions:", "## Imported Functions"},
  };
}

// An empty `worlds` object renders as nothing; only a missing or non-object
// `worlds` gets the notice.
bool HasWorldsObject(const docs::DocTree& tree) {
  const core::json::Value document = docs::DocumentOf(tree);
  const core::json::Value* worlds = document.Find("worlds");
  return worlds != nullptr && worlds->IsObject();
}

} // namespace

bool RenderStructured(const docs::DocTree& tree, std::ostream& out, std::string& error) {
  std::string text;
  if (!core::json::Write(docs::DocumentOf(tree), core::json::WriteStyle::kPretty, text, error)) {
    error = "failed to render docs as JSON: " + error;
    return false;
  }
  out << text << '\n';
  return true;
}

void RenderPlain(const docs::DocTree& tree, const DisplayFilter& filter, std::ostream& out) {
  if (!HasWorldsObject(tree)) {
    out << kNoWorldsMessage << '\n';
    return;
  }

  for (const auto& [world_name, world] : tree.worlds) {
    if (!filter.functions_only) {
      out << "🌍 World: " << world_name << '\n';
      out << "   📝 " << world.docs.value_or(kNoDocsPlaceholder) << '\n';
      out << '\n';
    }
    if (filter.worlds_only) {
      continue;
    }

    for (const FunctionSection& section : FunctionSectionsOf(world)) {
      if (section.functions == nullptr || section.functions->empty()) {
        continue;
      }
      if (!filter.functions_only) {
        out << section.plain_heading << '\n';
      }
      for (const auto& [func_name, func] : *section.functions) {
        out << "   🔧 " << func_name << ": " << func.docs.value_or(kNoDocsPlaceholder) << '\n';
      }
      out << '\n';
    }
  }
}

void RenderMarkdown(const docs::DocTree& tree, const DisplayFilter& filter, std::ostream& out) {
  if (!HasWorldsObject(tree)) {
    out << kNoWorldsMessage << '\n';
    return;
  }

  const std::string placeholder = std::string("*") + kNoDocsPlaceholder + "*";
  for (const auto& [world_name, world] : tree.worlds) {
    if (!filter.functions_only) {
      out << "# World: " << world_name << "\n\n";
      out << world.docs.value_or(placeholder) << "\n\n";
    }
    if (filter.worlds_only) {
      continue;
    }

    for (const FunctionSection& section : FunctionSectionsOf(world)) {
      if (section.functions == nullptr || section.functions->empty()) {
        continue;
      }
      if (!filter.functions_only) {
        out << section.markdown_heading << "\n\n";
      }
      for (const auto& [func_name, func] : *section.functions) {
        out << "### `" << func_name << "`\n";
        out << func.docs.value_or(placeholder) << "\n\n";
      }
    }
  }
}

} // namespace witdocs::render
