#include "core/fs_utils.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

using witdocs::tests::common::ScopedTempDir;

TEST_CASE("Atomic write creates parents and replaces existing files", "[core][fs]") {
  ScopedTempDir temp("witdocs-fs-atomic");
  const fs::path target = temp.path() / "nested" / "dir" / "out.wasm";
  std::string error;

  const std::vector<std::uint8_t> first = {0x00, 0x61, 0x73, 0x6D, 0xFF};
  REQUIRE(witdocs::core::WriteFileAtomic(target, first, error));

  std::vector<std::uint8_t> read_back;
  REQUIRE(witdocs::core::ReadBinaryFile(target, read_back, error));
  REQUIRE(read_back == first);

  REQUIRE(witdocs::core::WriteFileAtomic(target, std::string_view("text"), error));
  std::string text;
  REQUIRE(witdocs::core::ReadTextFile(target, text, error));
  REQUIRE(text == "text");

  // No temp siblings are left behind.
  std::size_t entries = 0;
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    (void)entry;
    ++entries;
  }
  REQUIRE(entries == 1U);
}

TEST_CASE("Atomic write onto a directory fails and keeps it intact", "[core][fs]") {
  ScopedTempDir temp("witdocs-fs-dir-target");
  const fs::path empty_dir = temp.path() / "empty.wasm";
  const fs::path full_dir = temp.path() / "full.wasm";
  fs::create_directories(empty_dir);
  fs::create_directories(full_dir);
  std::string error;
  REQUIRE(witdocs::core::WriteFileAtomic(full_dir / "keep.txt", std::string_view("keep"), error));

  REQUIRE_FALSE(witdocs::core::WriteFileAtomic(empty_dir, std::string_view("new"), error));
  REQUIRE(error.find("is a directory") != std::string::npos);
  REQUIRE_FALSE(witdocs::core::WriteFileAtomic(full_dir, std::string_view("new"), error));

  REQUIRE(fs::is_directory(empty_dir));
  REQUIRE(fs::is_directory(full_dir));
  std::string kept;
  REQUIRE(witdocs::core::ReadTextFile(full_dir / "keep.txt", kept, error));
  REQUIRE(kept == "keep");

  // Only the two directories remain; no temp or backup siblings.
  std::size_t entries = 0;
  for (const auto& entry : fs::directory_iterator(temp.path())) {
    (void)entry;
    ++entries;
  }
  REQUIRE(entries == 2U);
}

TEST_CASE("Reading a missing file reports the path", "[core][fs]") {
  ScopedTempDir temp("witdocs-fs-missing");
  std::vector<std::uint8_t> bytes;
  std::string error;
  REQUIRE_FALSE(witdocs::core::ReadBinaryFile(temp.path() / "absent.bin", bytes, error));
  REQUIRE(error.find("absent.bin") != std::string::npos);

  REQUIRE_FALSE(witdocs::core::EnsureParentDirectory(fs::path(), error));
  REQUIRE(error == "output path cannot be empty");
}
