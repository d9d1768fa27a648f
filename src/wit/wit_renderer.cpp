#include "wit/wit_renderer.hpp"

#include "core/fs_utils.hpp"
#include "core/utf8.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <system_error>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace witdocs::wit {

namespace {

constexpr int kShellCommandNotFound = 127;

#if defined(_WIN32)
std::string QuoteShellArg(std::string_view raw) {
  std::string quoted = "\"";
  for (const char c : raw) {
    if (c == '"') {
      quoted += "\\\"";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "\"";
  return quoted;
}
#else
std::string QuoteShellArg(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}
#endif

// Owns the temp file that receives the tool's stderr; removed on every exit
// path.
class ScopedTempFile {
public:
  ScopedTempFile() {
    static std::atomic<std::uint64_t> counter{0};
    const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
      dir = ".";
    }
    path_ = dir / ("witdocs-stderr-" + std::to_string(tick) + "-" +
                   std::to_string(counter.fetch_add(1U, std::memory_order_relaxed)) + ".txt");
  }

  ~ScopedTempFile() {
    std::error_code ec;
    (void)fs::remove(path_, ec);
  }

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const fs::path& path() const {
    return path_;
  }

private:
  fs::path path_;
};

bool RunCapturingStdout(const std::string& command, std::string& output, int& exit_code,
                        std::string& error) {
  output.clear();
  exit_code = -1;

#if defined(_WIN32)
  FILE* pipe = _popen(command.c_str(), "rb");
#else
  FILE* pipe = popen(command.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to start command: " + command;
    return false;
  }

  char buffer[4096];
  std::size_t read_count = 0;
  while ((read_count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0U) {
    output.append(buffer, read_count);
  }

#if defined(_WIN32)
  exit_code = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect exit status of: " + command;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

std::string ResolveWasmToolsBinary(std::string_view flag_value) {
  if (!flag_value.empty()) {
    return std::string(flag_value);
  }
  if (const char* env = std::getenv(kWasmToolsEnvVar); env != nullptr && *env != '\0') {
    return env;
  }
  return std::string(kDefaultWasmTools);
}

bool RenderComponentWit(const fs::path& component_path, const std::string& tool,
                        WitRenderResult& result, std::string& error) {
  result = WitRenderResult{};

  ScopedTempFile stderr_file;
  const std::string command = QuoteShellArg(tool) + " component wit " +
                              QuoteShellArg(component_path.string()) + " 2>" +
                              QuoteShellArg(stderr_file.path().string());

  if (!RunCapturingStdout(command, result.wit_text, result.exit_code, error)) {
    error = "failed to run " + tool + " component wit: " + error;
    return false;
  }

  std::string stderr_error;
  std::error_code ec;
  if (fs::exists(stderr_file.path(), ec) &&
      !core::ReadTextFile(stderr_file.path(), result.stderr_text, stderr_error)) {
    result.stderr_text = "(stderr unavailable: " + stderr_error + ")";
  }

  if (result.exit_code == kShellCommandNotFound) {
    error = tool + " not found (install wasm-tools or set " + std::string(kWasmToolsEnvVar) +
            "): " + TrimTrailingNewlines(result.stderr_text);
    return false;
  }
  if (result.exit_code != 0) {
    error = tool + " component wit failed (exit " + std::to_string(result.exit_code) +
            "): " + TrimTrailingNewlines(result.stderr_text);
    return false;
  }
  if (!core::IsValidUtf8(result.wit_text)) {
    error = tool + " component wit output is not valid UTF-8";
    return false;
  }
  return true;
}

} // namespace witdocs::wit
