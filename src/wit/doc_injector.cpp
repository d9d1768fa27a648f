#include "wit/doc_injector.hpp"

#include <cctype>
#include <vector>

namespace witdocs::wit {

namespace {

constexpr std::string_view kWorldPrefix = "world ";
constexpr std::string_view kExportPrefix = "export ";
constexpr std::string_view kImportPrefix = "import ";
constexpr std::string_view kDocCommentPrefix = "/// ";
constexpr std::string_view kUnknownWorld = "unknown";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && IsSpace(raw[begin])) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && IsSpace(raw[end - 1])) {
    --end;
  }
  return raw.substr(begin, end - begin);
}

std::string_view LeadingWhitespace(std::string_view line) {
  std::size_t end = 0;
  while (end < line.size() && IsSpace(line[end])) {
    ++end;
  }
  return line.substr(0, end);
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

// Splits on '\n', dropping one trailing '\r' per line. A final newline does
// not produce an empty trailing line, and empty input yields no lines.
std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    const std::size_t next = end == std::string_view::npos ? text.size() : end + 1U;
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = next;
  }
  return lines;
}

std::vector<std::string_view> SplitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && IsSpace(text[i])) {
      ++i;
    }
    const std::size_t start = i;
    while (i < text.size() && !IsSpace(text[i])) {
      ++i;
    }
    if (i > start) {
      tokens.push_back(text.substr(start, i - start));
    }
  }
  return tokens;
}

std::optional<std::string> DocsFromCollection(const docs::FuncDocsMap* functions,
                                              std::string_view name) {
  if (functions == nullptr) {
    return std::nullopt;
  }
  const auto it = functions->find(std::string(name));
  if (it == functions->end()) {
    return std::nullopt;
  }
  return it->second.docs;
}

void AppendDocComment(std::string& out, std::string_view indent, std::string_view docs) {
  for (const std::string_view doc_line : SplitLines(docs)) {
    out.append(indent);
    out.append(kDocCommentPrefix);
    out.append(doc_line);
    out.push_back('\n');
  }
}

void AppendLine(std::string& out, std::string_view line) {
  out.append(line);
  out.push_back('\n');
}

} // namespace

const docs::WorldDocs* ResolveWorld(const docs::DocTree& tree, std::string_view world_name) {
  const auto exact = tree.worlds.find(std::string(world_name));
  if (exact != tree.worlds.end()) {
    return &exact->second;
  }
  if (tree.worlds.size() == 1U) {
    return &tree.worlds.begin()->second;
  }
  return nullptr;
}

std::optional<std::string> ResolveWorldDocs(const docs::DocTree& tree,
                                            std::string_view world_name) {
  const docs::WorldDocs* world = ResolveWorld(tree, world_name);
  if (world == nullptr) {
    return std::nullopt;
  }
  return world->docs;
}

std::optional<std::string> ResolveFunctionDocs(const docs::DocTree& tree,
                                               std::string_view world_name,
                                               std::string_view function_name) {
  const docs::WorldDocs* world = ResolveWorld(tree, world_name);
  if (world == nullptr) {
    return std::nullopt;
  }
  return DocsFromCollection(docs::ExportedFunctions(*world), function_name);
}

std::string ExtractWorldName(std::string_view trimmed_line) {
  const std::vector<std::string_view> tokens = SplitWhitespace(trimmed_line);
  if (tokens.size() < 2U) {
    return std::string(kUnknownWorld);
  }
  return std::string(tokens[1]);
}

std::optional<std::string> ExtractFunctionName(std::string_view trimmed_line) {
  const std::size_t colon = trimmed_line.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  const std::vector<std::string_view> tokens = SplitWhitespace(trimmed_line.substr(0, colon));
  if (tokens.size() < 2U) {
    return std::nullopt;
  }
  return std::string(tokens[1]);
}

std::string InjectDocs(std::string_view wit_text, const docs::DocTree& tree) {
  const std::vector<std::string_view> lines = SplitLines(wit_text);
  std::string out;
  out.reserve(wit_text.size() + wit_text.size() / 2U);

  std::size_t i = 0;
  while (i < lines.size()) {
    const std::string_view header = Trim(lines[i]);
    if (!StartsWith(header, kWorldPrefix)) {
      AppendLine(out, lines[i]);
      ++i;
      continue;
    }

    const std::string world_name = ExtractWorldName(header);
    if (const std::optional<std::string> world_docs = ResolveWorldDocs(tree, world_name);
        world_docs.has_value()) {
      AppendDocComment(out, {}, *world_docs);
    }
    AppendLine(out, lines[i]);
    ++i;

    // World body: emit verbatim, annotating export/import lines, up to and
    // including the first line that trims to a lone closing brace.
    while (i < lines.size()) {
      const std::string_view line = lines[i];
      const std::string_view trimmed = Trim(line);

      if (StartsWith(trimmed, kExportPrefix) || StartsWith(trimmed, kImportPrefix)) {
        if (const std::optional<std::string> name = ExtractFunctionName(trimmed);
            name.has_value()) {
          if (const std::optional<std::string> func_docs =
                  ResolveFunctionDocs(tree, world_name, *name);
              func_docs.has_value()) {
            AppendDocComment(out, LeadingWhitespace(line), *func_docs);
          }
        }
      }

      AppendLine(out, line);
      ++i;
      if (trimmed == "}") {
        break;
      }
    }
  }

  return out;
}

} // namespace witdocs::wit
