#ifndef WITDOCS_TESTS_COMMON_ASSERTIONS_HPP_
#define WITDOCS_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace witdocs::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void Assert(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertExitCode(int actual, int expected, std::string_view context) {
  if (actual == expected) {
    return;
  }
  std::cerr << context << ": expected exit code " << expected << ", got " << actual << '\n';
  std::abort();
}

inline std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(input)),
                                   std::istreambuf_iterator<char>());
}

inline void WriteFileBytes(const std::filesystem::path& path,
                           const std::vector<std::uint8_t>& bytes) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  if (!output) {
    Fail("failed to write file: " + path.string());
  }
}

inline void WriteTextFile(const std::filesystem::path& path, std::string_view text) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output << text;
  if (!output) {
    Fail("failed to write file: " + path.string());
  }
}

} // namespace witdocs::tests::common

#endif // WITDOCS_TESTS_COMMON_ASSERTIONS_HPP_
