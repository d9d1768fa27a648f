#include "docs/doc_sources.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace witdocs::docs {

namespace {

enum class ScanScope {
  kTopLevel,
  kWorldBody,
  kOtherBody,
};

std::string_view TrimView(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return raw.substr(begin, end - begin);
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::vector<std::string_view> SplitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
      ++i;
    }
    const std::size_t start = i;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
      ++i;
    }
    if (i > start) {
      tokens.push_back(text.substr(start, i - start));
    }
  }
  return tokens;
}

// `%name` is WIT's keyword escape; the resolved name has no `%`.
std::string UnescapeIdentifier(std::string_view name) {
  if (!name.empty() && name.front() == '%') {
    name.remove_prefix(1);
  }
  return std::string(name);
}

std::string_view StripLineComment(std::string_view line) {
  const std::size_t pos = line.find("//");
  if (pos == std::string_view::npos) {
    return line;
  }
  return line.substr(0, pos);
}

int BraceDelta(std::string_view line) {
  int delta = 0;
  for (const char c : StripLineComment(line)) {
    if (c == '{') {
      ++delta;
    } else if (c == '}') {
      --delta;
    }
  }
  return delta;
}

std::optional<std::string> TakePendingDocs(std::vector<std::string>& pending) {
  if (pending.empty()) {
    return std::nullopt;
  }
  std::string joined;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    if (i > 0U) {
      joined.push_back('\n');
    }
    joined += pending[i];
  }
  pending.clear();
  return joined;
}

// `package ns:name@1.0.0;` -> `ns:name@1.0.0`
std::string ParsePackageId(std::string_view trimmed) {
  std::string_view rest = TrimView(trimmed.substr(std::string_view("package").size()));
  const std::size_t end = rest.find_first_of(";{");
  if (end != std::string_view::npos) {
    rest = rest.substr(0, end);
  }
  return std::string(TrimView(rest));
}

// `world name {` -> `name`
std::string ParseWorldName(std::string_view trimmed) {
  const std::vector<std::string_view> tokens = SplitWhitespace(trimmed);
  if (tokens.size() < 2U) {
    return {};
  }
  std::string_view name = tokens[1];
  const std::size_t brace = name.find('{');
  if (brace != std::string_view::npos) {
    name = name.substr(0, brace);
  }
  return UnescapeIdentifier(name);
}

// `export name: func(...)` / `import name: async func(...)` -> `name`.
// Interface and type exports (`export wasi:cli/run;`, `export x: interface {`)
// are not functions and yield nullopt.
std::optional<std::string> ParseWorldFunctionName(std::string_view trimmed) {
  const std::size_t colon = trimmed.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  const std::vector<std::string_view> head = SplitWhitespace(trimmed.substr(0, colon));
  if (head.size() != 2U) {
    return std::nullopt;
  }
  const std::string_view rest = TrimView(trimmed.substr(colon + 1U));
  if (!StartsWith(rest, "func") && !StartsWith(rest, "async func")) {
    return std::nullopt;
  }
  return UnescapeIdentifier(head[1]);
}

class WitDocScanner {
public:
  WitDocScanner(PackageDocs& package, std::string& error) : package_(package), error_(error) {}

  bool ScanFile(const fs::path& path, std::string_view text) {
    scope_ = ScanScope::kTopLevel;
    depth_ = 0;
    pending_.clear();
    world_ = nullptr;

    std::istringstream lines{std::string(text)};
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(lines, line)) {
      ++line_number;
      if (!ScanLine(TrimView(line))) {
        error_ = path.string() + ":" + std::to_string(line_number) + ": " + error_;
        return false;
      }
    }
    return true;
  }

private:
  bool ScanLine(std::string_view trimmed) {
    if (trimmed.empty()) {
      return true;
    }
    if (StartsWith(trimmed, "///")) {
      std::string_view doc = trimmed;
      while (!doc.empty() && doc.front() == '/') {
        doc.remove_prefix(1);
      }
      pending_.emplace_back(TrimView(doc));
      return true;
    }
    if (StartsWith(trimmed, "//")) {
      return true;
    }
    // `@since(...)` and friends sit between a doc run and its item.
    if (StartsWith(trimmed, "@")) {
      return true;
    }

    switch (scope_) {
    case ScanScope::kTopLevel:
      return ScanTopLevel(trimmed);
    case ScanScope::kWorldBody:
      ScanWorldBody(trimmed);
      return true;
    case ScanScope::kOtherBody:
      CloseBlockIfDone(trimmed);
      pending_.clear();
      return true;
    }
    return true;
  }

  bool ScanTopLevel(std::string_view trimmed) {
    if (StartsWith(trimmed, "package ")) {
      const std::string id = ParsePackageId(trimmed);
      if (id.empty()) {
        error_ = "package declaration has no name";
        return false;
      }
      std::optional<std::string> docs = TakePendingDocs(pending_);
      if (package_.package_id.empty()) {
        package_.package_id = id;
        package_.tree.docs = std::move(docs);
      }
      return true;
    }

    if (StartsWith(trimmed, "world ")) {
      const std::string name = ParseWorldName(trimmed);
      if (name.empty()) {
        error_ = "world declaration has no name";
        return false;
      }
      WorldDocs& world = package_.tree.worlds[name];
      if (std::optional<std::string> docs = TakePendingDocs(pending_); docs.has_value()) {
        world.docs = std::move(docs);
      }
      if (!world.func_exports.has_value()) {
        world.func_exports = FuncDocsMap{};
      }
      world_ = &world;
      depth_ = BraceDelta(trimmed);
      scope_ = depth_ > 0 ? ScanScope::kWorldBody : ScanScope::kTopLevel;
      return true;
    }

    depth_ = BraceDelta(trimmed);
    scope_ = depth_ > 0 ? ScanScope::kOtherBody : ScanScope::kTopLevel;
    pending_.clear();
    return true;
  }

  void ScanWorldBody(std::string_view trimmed) {
    if (depth_ == 1 && world_ != nullptr) {
      const bool is_export = StartsWith(trimmed, "export ");
      const bool is_import = StartsWith(trimmed, "import ");
      if (is_export || is_import) {
        if (std::optional<std::string> name = ParseWorldFunctionName(trimmed); name.has_value()) {
          FuncDocs func;
          func.docs = TakePendingDocs(pending_);
          FuncDocsMap& target = is_export ? *world_->func_exports : world_->func_imports;
          target[*name] = std::move(func);
        }
      }
    }
    CloseBlockIfDone(trimmed);
    pending_.clear();
  }

  void CloseBlockIfDone(std::string_view trimmed) {
    depth_ += BraceDelta(trimmed);
    if (depth_ <= 0) {
      depth_ = 0;
      scope_ = ScanScope::kTopLevel;
      world_ = nullptr;
    }
  }

  PackageDocs& package_;
  std::string& error_;
  ScanScope scope_ = ScanScope::kTopLevel;
  int depth_ = 0;
  std::vector<std::string> pending_;
  WorldDocs* world_ = nullptr;
};

bool CollectWitFiles(const fs::path& wit_dir, std::vector<fs::path>& files, std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(wit_dir, ec) || ec) {
    error = "WIT directory not found: " + wit_dir.string();
    return false;
  }

  files.clear();
  for (const auto& entry : fs::directory_iterator(wit_dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".wit") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed while listing WIT directory '" + wit_dir.string() + "': " + ec.message();
    return false;
  }

  std::sort(files.begin(), files.end());
  if (files.empty()) {
    error = "no .wit files found in " + wit_dir.string();
    return false;
  }
  return true;
}

} // namespace

bool ReadWitDirectory(const fs::path& wit_dir, PackageDocs& package, std::string& error) {
  PackageDocs scanned;
  if (!CollectWitFiles(wit_dir, scanned.source_files, error)) {
    return false;
  }

  WitDocScanner scanner(scanned, error);
  for (const fs::path& path : scanned.source_files) {
    std::string text;
    if (!core::ReadTextFile(path, text, error)) {
      return false;
    }
    if (!core::IsValidUtf8(text)) {
      error = path.string() + ": file is not valid UTF-8";
      return false;
    }
    if (!scanner.ScanFile(path, text)) {
      return false;
    }
  }

  if (scanned.package_id.empty()) {
    error = "no package declaration found in " + wit_dir.string();
    return false;
  }

  package = std::move(scanned);
  return true;
}

bool LoadDocsJsonFile(const fs::path& json_path, PackageDocs& package, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(json_path, text, error)) {
    return false;
  }

  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = json_path.string() + ": " + error;
    return false;
  }

  PackageDocs loaded;
  if (!DocTreeFromJson(root, loaded.tree, error)) {
    error = json_path.string() + ": " + error;
    return false;
  }

  const core::json::Value* package_field = root.Find("package");
  if (package_field != nullptr && package_field->type == core::json::Value::Type::kString &&
      !package_field->string_value.empty()) {
    loaded.package_id = package_field->string_value;
  } else {
    loaded.package_id = json_path.stem().string();
  }
  loaded.source_files.push_back(json_path);

  package = std::move(loaded);
  return true;
}

} // namespace witdocs::docs
