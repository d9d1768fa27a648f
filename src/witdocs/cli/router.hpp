#pragma once

#include "core/logging/logger.hpp"
#include "wasm/module_rewriter.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace witdocs::cli {

// Options for `wit-docs-inject`. Exactly one of `wit_dir` / `docs_json_path`
// names the documentation source.
struct InjectOptions {
  std::filesystem::path component_path;
  std::filesystem::path wit_dir;
  std::filesystem::path docs_json_path;
  std::optional<std::filesystem::path> output_path;
  bool in_place = false;
  wasm::DuplicatePolicy duplicate_policy = wasm::DuplicatePolicy::kReplace;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

enum class ViewFormat {
  kPretty,
  kJson,
  kMarkdown,
  kWit,
};

bool ParseViewFormat(std::string_view raw, ViewFormat& format, std::string& error);

// Options for `wit-docs-view`.
struct ViewOptions {
  std::filesystem::path component_path;
  ViewFormat format = ViewFormat::kPretty;
  bool functions_only = false;
  bool worlds_only = false;
  // Empty means WITDOCS_WASM_TOOLS or `wasm-tools`.
  std::string wasm_tools;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
};

// Default output path when neither --out nor --inplace is given:
// `<dir>/<stem>.docs.wasm`, or `<dir>/<stem>.docs.injected.wasm` when that
// would be the input path itself.
std::filesystem::path DeriveOutputPath(const std::filesystem::path& component_path);

// Runs the inject pipeline: read component, collect docs, encode payload,
// rewrite module, publish output. Returns a core::errors::ExitCode value.
int ExecuteInject(const InjectOptions& options);

// Runs the view pipeline and writes the rendering to `out`. Diagnostics go to
// std::cerr. Returns a core::errors::ExitCode value; kNoDocs when the
// component has no `package-docs` section.
int ExecuteView(const ViewOptions& options, std::ostream& out);

// Entry points for the two executables. Exit codes follow
// core::errors::ExitCode (0 ok, 1 failure, 2 usage, 3 no docs, 10+ by step).
int DispatchInject(int argc, char** argv);
int DispatchView(int argc, char** argv);

} // namespace witdocs::cli
