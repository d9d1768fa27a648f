#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "../common/wasm_fixtures.hpp"
#include "core/errors/exit_codes.hpp"
#include "wit/wit_renderer.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDocsJson = R"({
  "docs": "Greeting package.",
  "worlds": {
    "greeter": {
      "docs": "Greets people.\nPolitely.",
      "func_exports": {"hello": {"docs": "Says hello."}},
      "func_imports": {"log": {"docs": "Writes a log line."}}
    }
  }
})";

// Stands in for `wasm-tools component wit <path>`. The `log` import stays
// bare: import lines only take docs from `func_exports`.
constexpr std::string_view kFakeTool = R"(#!/bin/sh
if [ "$1" != "component" ] || [ "$2" != "wit" ] || [ ! -f "$3" ]; then
  echo "unexpected arguments: $*" >&2
  exit 9
fi
cat <<'WIT'
package example:greeter@0.1.0;

world greeter {
	export hello: func(name: string) -> string;
  import log: func(line: string);
  export other: func();
}
WIT
)";

constexpr std::string_view kFailingTool = R"(#!/bin/sh
echo "boom: unsupported component" >&2
exit 4
)";

constexpr std::string_view kExpectedWit = "package example:greeter@0.1.0;\n"
                                          "\n"
                                          "/// Greets people.\n"
                                          "/// Politely.\n"
                                          "world greeter {\n"
                                          "\t/// Says hello.\n"
                                          "\texport hello: func(name: string) -> string;\n"
                                          "  import log: func(line: string);\n"
                                          "  export other: func();\n"
                                          "}\n"
                                          "\n";

fs::path WriteScript(const fs::path& path, std::string_view body) {
  witdocs::tests::common::WriteTextFile(path, body);
  std::error_code ec;
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
  if (ec) {
    witdocs::tests::common::Fail("failed to mark script executable: " + path.string());
  }
  return path;
}

} // namespace

int main() {
#if defined(_WIN32)
  return 0;
#else
  using witdocs::core::errors::ExitCode;
  using witdocs::core::errors::ToInt;
  using witdocs::tests::common::AssertContains;
  using witdocs::tests::common::AssertExitCode;
  using witdocs::tests::common::MinimalComponent;
  using witdocs::tests::common::RunInject;
  using witdocs::tests::common::RunView;
  using witdocs::tests::common::ScopedTempDir;
  using witdocs::tests::common::WriteFileBytes;
  using witdocs::tests::common::WriteTextFile;

  ScopedTempDir temp("witdocs-view-wit");
  const fs::path component = temp.path() / "greeter.wasm";
  const fs::path documented = temp.path() / "greeter.docs.wasm";
  const fs::path docs_json = temp.path() / "docs.json";
  WriteFileBytes(component, MinimalComponent());
  WriteTextFile(docs_json, kDocsJson);

  const auto inject = RunInject({"--component", component.string(), "--docs-json",
                                 docs_json.string(), "--log-level", "error"});
  AssertExitCode(inject.exit_code, ToInt(ExitCode::kSuccess), "inject docs json");

  const fs::path fake_tool = WriteScript(temp.path() / "fake-wasm-tools", kFakeTool);
  const fs::path failing_tool = WriteScript(temp.path() / "failing-wasm-tools", kFailingTool);

  const auto annotated =
      RunView({documented.string(), "--format", "wit", "--wasm-tools", fake_tool.string()});
  AssertExitCode(annotated.exit_code, ToInt(ExitCode::kSuccess), "view --format wit");
  if (annotated.out != kExpectedWit) {
    witdocs::tests::common::Fail("unexpected annotated WIT:\n" + annotated.out);
  }

  // Non-zero tool exit surfaces the tool's stderr.
  const auto failed =
      RunView({documented.string(), "--format", "wit", "--wasm-tools", failing_tool.string()});
  AssertExitCode(failed.exit_code, ToInt(ExitCode::kSubprocess), "failing tool");
  AssertContains(failed.err, "component wit failed (exit 4)");
  AssertContains(failed.err, "boom: unsupported component");

  const auto missing = RunView({documented.string(), "--format", "wit", "--wasm-tools",
                                (temp.path() / "no-such-tool").string()});
  AssertExitCode(missing.exit_code, ToInt(ExitCode::kSubprocess), "missing tool");
  AssertContains(missing.err, "not found");

  // Environment override applies when no flag is given; the flag still wins.
  if (::setenv(witdocs::wit::kWasmToolsEnvVar, fake_tool.c_str(), 1) != 0) {
    witdocs::tests::common::Fail("setenv failed");
  }
  const auto from_env = RunView({documented.string(), "--format", "wit"});
  AssertExitCode(from_env.exit_code, ToInt(ExitCode::kSuccess), "tool from environment");
  AssertContains(from_env.out, "/// Says hello.\n");

  if (::setenv(witdocs::wit::kWasmToolsEnvVar, failing_tool.c_str(), 1) != 0) {
    witdocs::tests::common::Fail("setenv failed");
  }
  const auto flag_wins =
      RunView({documented.string(), "--format", "wit", "--wasm-tools", fake_tool.string()});
  AssertExitCode(flag_wins.exit_code, ToInt(ExitCode::kSuccess), "flag overrides environment");
  ::unsetenv(witdocs::wit::kWasmToolsEnvVar);

  // Without docs the tool is never consulted.
  const auto no_docs =
      RunView({component.string(), "--format", "wit", "--wasm-tools", failing_tool.string()});
  AssertExitCode(no_docs.exit_code, ToInt(ExitCode::kNoDocs), "wit format without docs");

  return 0;
#endif
}
