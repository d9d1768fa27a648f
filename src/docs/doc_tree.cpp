#include "docs/doc_tree.hpp"

#include <utility>

namespace witdocs::docs {

namespace {

using JsonValue = core::json::Value;

bool ReadOptionalDocs(const JsonValue& object, const std::string& path,
                      std::optional<std::string>& docs, std::string& error) {
  docs.reset();
  const JsonValue* field = object.Find("docs");
  if (field == nullptr || field->IsNull()) {
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = path + ".docs must be a string or null";
    return false;
  }
  docs = field->string_value;
  return true;
}

bool ReadFuncDocsMap(const JsonValue& world, std::string_view key, const std::string& world_path,
                     std::optional<FuncDocsMap>& functions, std::string& error) {
  functions.reset();
  const JsonValue* field = world.Find(key);
  if (field == nullptr || field->IsNull()) {
    return true;
  }

  const std::string path = world_path + "." + std::string(key);
  if (!field->IsObject()) {
    error = path + " must be an object";
    return false;
  }

  FuncDocsMap parsed;
  for (const auto& [name, entry] : field->object_value) {
    const std::string entry_path = path + "." + name;
    if (!entry.IsObject()) {
      error = entry_path + " must be an object";
      return false;
    }
    FuncDocs func;
    if (!ReadOptionalDocs(entry, entry_path, func.docs, error)) {
      return false;
    }
    parsed.emplace(name, std::move(func));
  }
  functions = std::move(parsed);
  return true;
}

JsonValue FuncDocsMapToJson(const FuncDocsMap& functions) {
  JsonValue out = JsonValue::MakeObject();
  for (const auto& [name, func] : functions) {
    JsonValue entry = JsonValue::MakeObject();
    if (func.docs.has_value()) {
      entry.object_value["docs"] = JsonValue::MakeString(*func.docs);
    }
    out.object_value[name] = std::move(entry);
  }
  return out;
}

} // namespace

bool operator==(const DocTree& lhs, const DocTree& rhs) {
  return lhs.docs == rhs.docs && lhs.worlds == rhs.worlds;
}

bool DocTreeFromJson(const JsonValue& root, DocTree& tree, std::string& error) {
  if (!root.IsObject()) {
    error = "docs payload must be a JSON object";
    return false;
  }

  DocTree parsed;
  if (!ReadOptionalDocs(root, "$", parsed.docs, error)) {
    return false;
  }

  const JsonValue* worlds = root.Find("worlds");
  if (worlds != nullptr && !worlds->IsNull()) {
    if (!worlds->IsObject()) {
      error = "$.worlds must be an object";
      return false;
    }

    for (const auto& [name, world_value] : worlds->object_value) {
      const std::string path = "$.worlds." + name;
      if (!world_value.IsObject()) {
        error = path + " must be an object";
        return false;
      }

      WorldDocs world;
      if (!ReadOptionalDocs(world_value, path, world.docs, error) ||
          !ReadFuncDocsMap(world_value, "func_exports", path, world.func_exports, error) ||
          !ReadFuncDocsMap(world_value, "functions", path, world.functions, error)) {
        return false;
      }

      std::optional<FuncDocsMap> imports;
      if (!ReadFuncDocsMap(world_value, "func_imports", path, imports, error)) {
        return false;
      }
      if (imports.has_value()) {
        world.func_imports = std::move(*imports);
      }
      parsed.worlds.emplace(name, std::move(world));
    }
  }

  parsed.document = root;
  tree = std::move(parsed);
  return true;
}

JsonValue DocTreeToJson(const DocTree& tree) {
  JsonValue root = JsonValue::MakeObject();
  if (tree.docs.has_value()) {
    root.object_value["docs"] = JsonValue::MakeString(*tree.docs);
  }

  JsonValue worlds = JsonValue::MakeObject();
  for (const auto& [name, world] : tree.worlds) {
    JsonValue entry = JsonValue::MakeObject();
    if (world.docs.has_value()) {
      entry.object_value["docs"] = JsonValue::MakeString(*world.docs);
    }
    if (world.func_exports.has_value()) {
      entry.object_value["func_exports"] = FuncDocsMapToJson(*world.func_exports);
    }
    if (world.functions.has_value()) {
      entry.object_value["functions"] = FuncDocsMapToJson(*world.functions);
    }
    if (!world.func_imports.empty()) {
      entry.object_value["func_imports"] = FuncDocsMapToJson(world.func_imports);
    }
    worlds.object_value[name] = std::move(entry);
  }
  root.object_value["worlds"] = std::move(worlds);
  return root;
}

JsonValue DocumentOf(const DocTree& tree) {
  if (!tree.document.IsNull()) {
    return tree.document;
  }
  return DocTreeToJson(tree);
}

const FuncDocsMap* ExportedFunctions(const WorldDocs& world) {
  if (world.func_exports.has_value()) {
    return &*world.func_exports;
  }
  if (world.functions.has_value()) {
    return &*world.functions;
  }
  return nullptr;
}

} // namespace witdocs::docs
