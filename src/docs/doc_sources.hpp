#pragma once

#include "docs/doc_tree.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace witdocs::docs {

// Documentation for one WIT package, ready to be encoded into a component.
struct PackageDocs {
  std::string package_id;
  DocTree tree;
  std::vector<std::filesystem::path> source_files;
};

// Collects `///` documentation from every `*.wit` file directly inside
// `wit_dir` (sorted by file name).
//
// This is a line scanner, not a WIT parser: it recognizes `package <id>;`,
// `world <name> {` and `export|import <name>: func...` lines directly inside a
// world body, and attaches the doc-comment run immediately above each of them.
// Functions without doc comments are still recorded with no docs.
//
// Returns false and sets `error` when the directory cannot be read, holds no
// `.wit` files, or declares no package.
bool ReadWitDirectory(const std::filesystem::path& wit_dir, PackageDocs& package,
                      std::string& error);

// Loads a pre-extracted docs document (the same JSON shape stored in the
// `package-docs` section). The package id comes from an optional top-level
// `package` string, falling back to the file stem.
bool LoadDocsJsonFile(const std::filesystem::path& json_path, PackageDocs& package,
                      std::string& error);

} // namespace witdocs::docs
