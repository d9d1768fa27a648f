#include "witdocs/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "docs/doc_sources.hpp"
#include "docs/section_codec.hpp"
#include "render/doc_renderers.hpp"
#include "wasm/module_rewriter.hpp"
#include "wit/doc_injector.hpp"
#include "wit/wit_renderer.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace witdocs::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitNoDocs = core::errors::ToInt(core::errors::ExitCode::kNoDocs);
constexpr int kExitIo = core::errors::ToInt(core::errors::ExitCode::kIo);
constexpr int kExitParse = core::errors::ToInt(core::errors::ExitCode::kParse);
constexpr int kExitSubprocess = core::errors::ToInt(core::errors::ExitCode::kSubprocess);
constexpr int kExitEncoding = core::errors::ToInt(core::errors::ExitCode::kEncoding);

void PrintInjectUsage(std::ostream& out) {
  out << "usage:\n"
      << "  wit-docs-inject --component <in.wasm> (--wit-dir <dir> | --docs-json <file>)\n"
      << "                  [--out <path> | --inplace] [--keep-existing]\n"
      << "                  [--log-level <debug|info|warn|error>]\n"
      << "  wit-docs-inject --version\n";
}

void PrintViewUsage(std::ostream& out) {
  out << "usage:\n"
      << "  wit-docs-view <component.wasm> [--format <pretty|json|markdown|wit>]\n"
      << "                [--functions-only] [--worlds-only] [--wasm-tools <path>]\n"
      << "                [--log-level <debug|info|warn|error>]\n"
      << "  wit-docs-view --version\n";
}

bool IsHelpToken(std::string_view token) {
  return token == "help" || token == "--help" || token == "-h";
}

// Reads the value that follows a flag, advancing `i` past it.
bool TakeFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view flag, std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[++i];
  return true;
}

// Parse inject args with an explicit contract:
// - --component and one docs source are required
// - --out and --inplace are mutually exclusive
// Unknown flags and positional args are usage errors.
bool ParseInjectOptions(const std::vector<std::string_view>& args, InjectOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--inplace") {
      options.in_place = true;
      continue;
    }
    if (token == "--keep-existing") {
      options.duplicate_policy = wasm::DuplicatePolicy::kAppend;
      continue;
    }
    if (token == "--component") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.component_path = fs::path(value);
      continue;
    }
    if (token == "--wit-dir") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.wit_dir = fs::path(value);
      continue;
    }
    if (token == "--docs-json") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.docs_json_path = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.output_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeFlagValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }

  if (options.component_path.empty()) {
    error = "--component <in.wasm> is required";
    return false;
  }
  if (options.wit_dir.empty() == options.docs_json_path.empty()) {
    error = "exactly one of --wit-dir <dir> or --docs-json <file> is required";
    return false;
  }
  if (options.in_place && options.output_path.has_value()) {
    error = "--out and --inplace cannot be combined";
    return false;
  }
  return true;
}

bool ParseViewOptions(const std::vector<std::string_view>& args, ViewOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--functions-only") {
      options.functions_only = true;
      continue;
    }
    if (token == "--worlds-only") {
      options.worlds_only = true;
      continue;
    }
    if (token == "--format") {
      if (!TakeFlagValue(args, i, token, value, error) ||
          !ParseViewFormat(value, options.format, error)) {
        return false;
      }
      continue;
    }
    if (token == "--wasm-tools") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.wasm_tools = std::string(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeFlagValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.component_path.empty()) {
      error = "view accepts exactly 1 component path";
      return false;
    }
    options.component_path = fs::path(token);
  }

  if (options.component_path.empty()) {
    error = "view requires exactly 1 argument: <component.wasm>";
    return false;
  }
  return true;
}

const fs::path& DocsSourcePath(const InjectOptions& options) {
  return options.wit_dir.empty() ? options.docs_json_path : options.wit_dir;
}

// Filesystem preflight for the docs source. Keeps missing/unreadable paths
// (IO failures) apart from malformed content (parse failures).
bool ValidateDocsSourcePath(const InjectOptions& options, std::string& error) {
  const fs::path& path = DocsSourcePath(options);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "docs source not found: " + path.string();
    return false;
  }
  if (!options.wit_dir.empty()) {
    if (!fs::is_directory(path, ec) || ec) {
      error = "--wit-dir must point to a directory: " + path.string();
      return false;
    }
    return true;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "--docs-json must point to a regular file: " + path.string();
    return false;
  }
  return true;
}

bool LoadPackageDocs(const InjectOptions& options, docs::PackageDocs& package,
                     std::string& error) {
  if (!options.wit_dir.empty()) {
    return docs::ReadWitDirectory(options.wit_dir, package, error);
  }
  return docs::LoadDocsJsonFile(options.docs_json_path, package, error);
}

std::string ToDisplayString(ViewFormat format) {
  switch (format) {
  case ViewFormat::kPretty:
    return "pretty";
  case ViewFormat::kJson:
    return "json";
  case ViewFormat::kMarkdown:
    return "markdown";
  case ViewFormat::kWit:
    return "wit";
  }
  return "pretty";
}

int RenderView(const ViewOptions& options, const docs::DocTree& tree, std::ostream& out,
               core::logging::Logger& logger) {
  const render::DisplayFilter filter{
      .functions_only = options.functions_only,
      .worlds_only = options.worlds_only,
  };
  std::string error;

  switch (options.format) {
  case ViewFormat::kJson:
    if (!render::RenderStructured(tree, out, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitEncoding;
    }
    return kExitSuccess;
  case ViewFormat::kPretty:
    render::RenderPlain(tree, filter, out);
    return kExitSuccess;
  case ViewFormat::kMarkdown:
    render::RenderMarkdown(tree, filter, out);
    return kExitSuccess;
  case ViewFormat::kWit:
    break;
  }

  const std::string tool = wit::ResolveWasmToolsBinary(options.wasm_tools);
  logger.Debug("rendering component WIT", {{"tool", tool}});

  wit::WitRenderResult rendered;
  if (!wit::RenderComponentWit(options.component_path, tool, rendered, error)) {
    std::cerr << "error: failed to obtain WIT text for '" << options.component_path.string()
              << "': " << error << '\n';
    return kExitSubprocess;
  }

  out << wit::InjectDocs(rendered.wit_text, tree) << '\n';
  return kExitSuccess;
}

} // namespace

bool ParseViewFormat(std::string_view raw, ViewFormat& format, std::string& error) {
  if (raw == "pretty" || raw == "plain") {
    format = ViewFormat::kPretty;
  } else if (raw == "json") {
    format = ViewFormat::kJson;
  } else if (raw == "markdown") {
    format = ViewFormat::kMarkdown;
  } else if (raw == "wit") {
    format = ViewFormat::kWit;
  } else {
    error = "invalid --format '" + std::string(raw) + "' (expected pretty|json|markdown|wit)";
    return false;
  }
  return true;
}

fs::path DeriveOutputPath(const fs::path& component_path) {
  fs::path normalized = component_path;
  if (!normalized.has_extension()) {
    normalized.replace_extension("wasm");
  }

  const std::string stem = normalized.stem().string();
  const fs::path parent = normalized.parent_path();
  fs::path derived = parent / (stem + ".docs.wasm");
  if (derived == component_path) {
    derived = parent / (stem + ".docs.injected.wasm");
  }
  return derived;
}

int ExecuteInject(const InjectOptions& options) {
  core::logging::Logger logger("inject", options.log_level);
  logger.AddContext("component", options.component_path.string());

  std::vector<std::uint8_t> input;
  std::string error;
  if (!core::ReadBinaryFile(options.component_path, input, error)) {
    std::cerr << "error: reading component: " << error << '\n';
    return kExitIo;
  }
  logger.Debug("component loaded", {{"bytes", std::to_string(input.size())}});

  if (!ValidateDocsSourcePath(options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitIo;
  }

  docs::PackageDocs package;
  if (!LoadPackageDocs(options, package, error)) {
    std::cerr << "error: collecting docs from '" << DocsSourcePath(options).string()
              << "': " << error << '\n';
    return kExitParse;
  }
  logger.Info("docs collected", {{"package", package.package_id},
                                 {"worlds", std::to_string(package.tree.worlds.size())},
                                 {"sources", std::to_string(package.source_files.size())}});

  std::vector<std::uint8_t> payload;
  if (!docs::EncodeDocsPayload(package.tree, payload, error)) {
    std::cerr << "error: encoding package-docs: " << error << '\n';
    return kExitEncoding;
  }

  std::vector<std::uint8_t> rewritten;
  wasm::RewriteStats stats;
  if (!wasm::RewriteWithCustomSection(input, docs::kDocsSectionName, payload,
                                      options.duplicate_policy, rewritten, error, &stats)) {
    std::cerr << "error: reencoding original component '" << options.component_path.string()
              << "': " << error << '\n';
    return kExitParse;
  }
  if (stats.sections_dropped > 0U) {
    logger.Warn("replaced existing package-docs section",
                {{"dropped", std::to_string(stats.sections_dropped)}});
  }
  logger.Debug("component rewritten", {{"kind", wasm::ToString(stats.kind)},
                                       {"sections_copied", std::to_string(stats.sections_copied)},
                                       {"payload_bytes", std::to_string(payload.size())}});

  fs::path out_path;
  if (options.in_place) {
    out_path = options.component_path;
  } else if (options.output_path.has_value()) {
    out_path = *options.output_path;
  } else {
    out_path = DeriveOutputPath(options.component_path);
  }

  if (!core::WriteFileAtomic(out_path, rewritten, error)) {
    std::cerr << "error: writing '" << out_path.string() << "': " << error << '\n';
    return kExitIo;
  }

  logger.Info("output written", {{"out", out_path.string()},
                                 {"bytes", std::to_string(rewritten.size())}});
  std::cerr << "Injected package-docs into \"" << out_path.string() << "\"\n";
  return kExitSuccess;
}

int ExecuteView(const ViewOptions& options, std::ostream& out) {
  core::logging::Logger logger("view", options.log_level);
  logger.AddContext("component", options.component_path.string());
  logger.Debug("view requested", {{"format", ToDisplayString(options.format)}});

  std::vector<std::uint8_t> bytes;
  std::string error;
  if (!core::ReadBinaryFile(options.component_path, bytes, error)) {
    std::cerr << "error: failed to read component file: " << error << '\n';
    return kExitIo;
  }

  docs::ExtractResult extracted;
  if (!docs::ExtractDocTree(bytes, extracted, error)) {
    std::cerr << "error: failed to extract package-docs from component: " << error << '\n';
    return kExitParse;
  }
  if (!extracted.tree.has_value()) {
    if (extracted.section_found) {
      logger.Debug("package-docs section carries no payload");
    }
    std::cerr << "No package-docs found in component\n";
    return kExitNoDocs;
  }

  return RenderView(options, *extracted.tree, out, logger);
}

int DispatchInject(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
  if (args.empty()) {
    PrintInjectUsage(std::cerr);
    return kExitUsage;
  }
  if (args.size() == 1U && IsHelpToken(args.front())) {
    PrintInjectUsage(std::cout);
    return kExitSuccess;
  }
  if (args.size() == 1U && args.front() == "--version") {
    std::cout << "wit-docs-inject " << kVersion << '\n';
    return kExitSuccess;
  }

  InjectOptions options;
  std::string error;
  if (!ParseInjectOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintInjectUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteInject(options);
}

int DispatchView(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
  if (args.empty()) {
    PrintViewUsage(std::cerr);
    return kExitUsage;
  }
  if (args.size() == 1U && IsHelpToken(args.front())) {
    PrintViewUsage(std::cout);
    return kExitSuccess;
  }
  if (args.size() == 1U && args.front() == "--version") {
    std::cout << "wit-docs-view " << kVersion << '\n';
    return kExitSuccess;
  }

  ViewOptions options;
  std::string error;
  if (!ParseViewOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintViewUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteView(options, std::cout);
}

} // namespace witdocs::cli
