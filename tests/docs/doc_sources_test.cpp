#include "docs/doc_sources.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

using witdocs::tests::common::ScopedTempDir;
using witdocs::tests::common::WriteTextFile;

namespace {

constexpr const char* kAppWit = R"(/// Greeting utilities.
/// Second paragraph line.
package example:greeter@0.1.0;

/// Shared types, never recorded as a world.
interface types {
  /// A name.
  type name = string;
  export ignored: func();
}

/// The app world.
world app {
  use types.{name};

  /// Runs the app.
  export run: func();
  // plain comment between doc and decl
  export undocumented: func() -> u32;

  /// Says hello.
  ///
  ///   Indented example.
  import greet: async func(who: name) -> string;

  /// Nested interface export, not a function.
  export api: interface {
    /// Inner function.
    ping: func();
  }

  /// Escaped keyword name.
  export %type: func();
}
)";

constexpr const char* kExtraWit = "package example:other;\r\n"
                                  "world cli {}\r\n"
                                  "/// Tool world.\r\n"
                                  "world tool {\r\n"
                                  "  /// Tool entry.\r\n"
                                  "  export main: func();\r\n"
                                  "}\r\n";

} // namespace

TEST_CASE("WIT scan collects package, world and function docs", "[docs][sources][wit]") {
  ScopedTempDir temp("witdocs-sources-scan");
  WriteTextFile(temp.path() / "a-app.wit", kAppWit);
  WriteTextFile(temp.path() / "b-extra.wit", kExtraWit);
  WriteTextFile(temp.path() / "notes.md", "/// not WIT\nworld ignored {}\n");

  witdocs::docs::PackageDocs package;
  std::string error;
  REQUIRE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));

  // First package declaration wins.
  REQUIRE(package.package_id == "example:greeter@0.1.0");
  REQUIRE(package.tree.docs ==
          std::optional<std::string>("Greeting utilities.\nSecond paragraph line."));
  REQUIRE(package.source_files.size() == 2U);
  REQUIRE(package.source_files[0].filename().string() == "a-app.wit");

  REQUIRE(package.tree.worlds.size() == 3U);
  REQUIRE(package.tree.worlds.count("types") == 0U);

  const auto& app = package.tree.worlds.at("app");
  REQUIRE(app.docs == std::optional<std::string>("The app world."));
  REQUIRE(app.func_exports.has_value());
  const auto& exports = *app.func_exports;
  REQUIRE(exports.size() == 3U);
  REQUIRE(exports.at("run").docs == std::optional<std::string>("Runs the app."));
  REQUIRE_FALSE(exports.at("undocumented").docs.has_value());
  REQUIRE(exports.at("type").docs == std::optional<std::string>("Escaped keyword name."));
  REQUIRE(exports.count("api") == 0U);
  REQUIRE(exports.count("ping") == 0U);

  REQUIRE(app.func_imports.at("greet").docs ==
          std::optional<std::string>("Says hello.\n\nIndented example."));

  const auto& cli = package.tree.worlds.at("cli");
  REQUIRE_FALSE(cli.docs.has_value());
  REQUIRE(cli.func_exports.has_value());
  REQUIRE(cli.func_exports->empty());

  const auto& tool = package.tree.worlds.at("tool");
  REQUIRE(tool.docs == std::optional<std::string>("Tool world."));
  REQUIRE(tool.func_exports->at("main").docs == std::optional<std::string>("Tool entry."));
}

TEST_CASE("WIT scan keeps docs across attribute lines", "[docs][sources][wit]") {
  ScopedTempDir temp("witdocs-sources-attributes");
  WriteTextFile(temp.path() / "app.wit", "package example:gated@0.2.0;\n"
                                         "\n"
                                         "/// The app world.\n"
                                         "@since(version = 0.2.0)\n"
                                         "world app {\n"
                                         "  /// Runs it.\n"
                                         "  @since(version = 0.2.0)\n"
                                         "  export run: func();\n"
                                         "  /// Logs a line.\n"
                                         "  @unstable(feature = logging)\n"
                                         "  @deprecated(version = 0.2.1)\n"
                                         "  import log: func(line: string);\n"
                                         "  @since(version = 0.2.0)\n"
                                         "  export bare: func();\n"
                                         "}\n");

  witdocs::docs::PackageDocs package;
  std::string error;
  REQUIRE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));

  const auto& app = package.tree.worlds.at("app");
  REQUIRE(app.docs == std::optional<std::string>("The app world."));
  REQUIRE(app.func_exports->at("run").docs == std::optional<std::string>("Runs it."));
  REQUIRE_FALSE(app.func_exports->at("bare").docs.has_value());
  REQUIRE(app.func_imports.at("log").docs == std::optional<std::string>("Logs a line."));
}

TEST_CASE("WIT scan reports unusable directories", "[docs][sources][wit]") {
  witdocs::docs::PackageDocs package;
  std::string error;

  ScopedTempDir temp("witdocs-sources-errors");
  REQUIRE_FALSE(witdocs::docs::ReadWitDirectory(temp.path() / "missing", package, error));
  REQUIRE(error.find("WIT directory not found") != std::string::npos);

  REQUIRE_FALSE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));
  REQUIRE(error.find("no .wit files found") != std::string::npos);

  WriteTextFile(temp.path() / "w.wit", "world lonely {\n}\n");
  REQUIRE_FALSE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));
  REQUIRE(error.find("no package declaration") != std::string::npos);

  WriteTextFile(temp.path() / "w.wit", "package ;\n");
  REQUIRE_FALSE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));
  REQUIRE(error.find("w.wit:1: package declaration has no name") != std::string::npos);

  WriteTextFile(temp.path() / "w.wit", "package a:b;\n\xFF\n");
  REQUIRE_FALSE(witdocs::docs::ReadWitDirectory(temp.path(), package, error));
  REQUIRE(error.find("not valid UTF-8") != std::string::npos);
}

TEST_CASE("Docs JSON loader takes the package id from the document or file stem",
          "[docs][sources][json]") {
  ScopedTempDir temp("witdocs-sources-json");
  const fs::path named = temp.path() / "named.json";
  const fs::path anonymous = temp.path() / "my-package.json";
  WriteTextFile(named, R"({"package":"ns:pkg@2.0.0","worlds":{"w":{"docs":"W."}}})");
  WriteTextFile(anonymous, R"({"worlds":{}})");

  witdocs::docs::PackageDocs package;
  std::string error;
  REQUIRE(witdocs::docs::LoadDocsJsonFile(named, package, error));
  REQUIRE(package.package_id == "ns:pkg@2.0.0");
  REQUIRE(package.tree.worlds.at("w").docs == std::optional<std::string>("W."));
  REQUIRE(package.tree.document.Find("package") != nullptr);
  REQUIRE(package.source_files.size() == 1U);
  REQUIRE(package.source_files[0].string() == named.string());

  REQUIRE(witdocs::docs::LoadDocsJsonFile(anonymous, package, error));
  REQUIRE(package.package_id == "my-package");
  REQUIRE(package.tree.worlds.empty());
}

TEST_CASE("Docs JSON loader rejects unreadable or malformed files", "[docs][sources][json]") {
  ScopedTempDir temp("witdocs-sources-json-errors");
  witdocs::docs::PackageDocs package;
  std::string error;

  REQUIRE_FALSE(witdocs::docs::LoadDocsJsonFile(temp.path() / "absent.json", package, error));

  const fs::path broken = temp.path() / "broken.json";
  WriteTextFile(broken, "{\"worlds\":");
  REQUIRE_FALSE(witdocs::docs::LoadDocsJsonFile(broken, package, error));
  REQUIRE(error.find("broken.json: parse error") != std::string::npos);

  const fs::path wrong_shape = temp.path() / "shape.json";
  WriteTextFile(wrong_shape, R"({"worlds":{"w":{"docs":1}}})");
  REQUIRE_FALSE(witdocs::docs::LoadDocsJsonFile(wrong_shape, package, error));
  REQUIRE(error.find("$.worlds.w.docs must be a string or null") != std::string::npos);
}
