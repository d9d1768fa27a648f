#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "../common/wasm_fixtures.hpp"
#include "core/errors/exit_codes.hpp"
#include "witdocs/cli/router.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using witdocs::core::errors::ExitCode;
  using witdocs::core::errors::ToInt;
  using witdocs::tests::common::Assert;
  using witdocs::tests::common::AssertContains;
  using witdocs::tests::common::AssertExitCode;
  using witdocs::tests::common::MinimalComponent;
  using witdocs::tests::common::RunInject;
  using witdocs::tests::common::RunView;
  using witdocs::tests::common::ScopedTempDir;
  using witdocs::tests::common::WriteFileBytes;
  using witdocs::tests::common::WriteTextFile;

  const int usage = ToInt(ExitCode::kUsage);

  // Help and version go to stdout and succeed.
  const auto inject_help = RunInject({"--help"});
  AssertExitCode(inject_help.exit_code, ToInt(ExitCode::kSuccess), "inject --help");
  AssertContains(inject_help.out, "wit-docs-inject --component <in.wasm>");
  const auto view_version = RunView({"--version"});
  AssertExitCode(view_version.exit_code, ToInt(ExitCode::kSuccess), "view --version");
  AssertContains(view_version.out, "wit-docs-view 0.1.0");

  // Usage errors print the reason and the usage text to stderr.
  const auto no_args = RunInject({});
  AssertExitCode(no_args.exit_code, usage, "inject without args");
  AssertContains(no_args.err, "usage:");

  const auto no_source = RunInject({"--component", "a.wasm"});
  AssertExitCode(no_source.exit_code, usage, "inject without docs source");
  AssertContains(no_source.err, "exactly one of --wit-dir <dir> or --docs-json <file>");

  const auto both_sources =
      RunInject({"--component", "a.wasm", "--wit-dir", "wit", "--docs-json", "d.json"});
  AssertExitCode(both_sources.exit_code, usage, "inject with two docs sources");

  const auto out_and_inplace =
      RunInject({"--component", "a.wasm", "--wit-dir", "wit", "--out", "b.wasm", "--inplace"});
  AssertExitCode(out_and_inplace.exit_code, usage, "--out with --inplace");
  AssertContains(out_and_inplace.err, "--out and --inplace cannot be combined");

  const auto dangling = RunInject({"--component"});
  AssertExitCode(dangling.exit_code, usage, "flag without value");
  AssertContains(dangling.err, "missing value for --component");

  const auto bad_level =
      RunInject({"--component", "a.wasm", "--wit-dir", "wit", "--log-level", "loud"});
  AssertExitCode(bad_level.exit_code, usage, "bad log level");
  AssertContains(bad_level.err, "invalid --log-level 'loud'");

  const auto unknown = RunView({"a.wasm", "--colour"});
  AssertExitCode(unknown.exit_code, usage, "unknown view flag");
  AssertContains(unknown.err, "unknown option: --colour");

  const auto two_paths = RunView({"a.wasm", "b.wasm"});
  AssertExitCode(two_paths.exit_code, usage, "two component paths");

  const auto bad_format = RunView({"a.wasm", "--format", "yaml"});
  AssertExitCode(bad_format.exit_code, usage, "unknown format");
  AssertContains(bad_format.err, "invalid --format 'yaml'");

  witdocs::cli::ViewFormat format = witdocs::cli::ViewFormat::kJson;
  std::string error;
  Assert(witdocs::cli::ParseViewFormat("plain", format, error) &&
             format == witdocs::cli::ViewFormat::kPretty,
         "plain should alias pretty");

  // Output path derivation.
  Assert(witdocs::cli::DeriveOutputPath("out/app.wasm") == fs::path("out/app.docs.wasm"),
         "derived path for app.wasm");
  Assert(witdocs::cli::DeriveOutputPath("app") == fs::path("app.docs.wasm"),
         "derived path without extension");

  // Failure classes map to their exit codes.
  ScopedTempDir temp("witdocs-cli-contract");
  const fs::path component = temp.path() / "app.wasm";
  WriteFileBytes(component, MinimalComponent());

  const auto missing_component = RunInject({"--component", (temp.path() / "nope.wasm").string(),
                                            "--wit-dir", temp.path().string()});
  AssertExitCode(missing_component.exit_code, ToInt(ExitCode::kIo), "missing component");
  AssertContains(missing_component.err, "error: reading component:");

  const auto missing_source = RunInject(
      {"--component", component.string(), "--docs-json", (temp.path() / "nope.json").string()});
  AssertExitCode(missing_source.exit_code, ToInt(ExitCode::kIo), "missing docs source");
  AssertContains(missing_source.err, "docs source not found");

  const auto file_as_dir =
      RunInject({"--component", component.string(), "--wit-dir", component.string()});
  AssertExitCode(file_as_dir.exit_code, ToInt(ExitCode::kIo), "--wit-dir pointing at a file");

  const fs::path bad_json = temp.path() / "bad.json";
  WriteTextFile(bad_json, R"({"worlds": {"w": []}})");
  const auto malformed_docs =
      RunInject({"--component", component.string(), "--docs-json", bad_json.string()});
  AssertExitCode(malformed_docs.exit_code, ToInt(ExitCode::kParse), "malformed docs json");
  AssertContains(malformed_docs.err, "$.worlds.w must be an object");

  const fs::path not_wasm = temp.path() / "not.wasm";
  WriteTextFile(not_wasm, "definitely not a module");
  const fs::path good_json = temp.path() / "good.json";
  WriteTextFile(good_json, R"({"worlds": {}})");
  const auto corrupt =
      RunInject({"--component", not_wasm.string(), "--docs-json", good_json.string()});
  AssertExitCode(corrupt.exit_code, ToInt(ExitCode::kParse), "corrupt component");
  AssertContains(corrupt.err, "not a structurally valid WebAssembly binary");
  Assert(!fs::exists(temp.path() / "not.docs.wasm"), "no output expected after a failure");

  return 0;
}
