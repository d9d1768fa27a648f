#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace witdocs::wit {

inline constexpr std::string_view kDefaultWasmTools = "wasm-tools";
inline constexpr const char* kWasmToolsEnvVar = "WITDOCS_WASM_TOOLS";

// Picks the rendering tool binary: explicit flag value, then the
// WITDOCS_WASM_TOOLS environment variable, then `wasm-tools` on PATH.
std::string ResolveWasmToolsBinary(std::string_view flag_value);

// Outcome of one `<tool> component wit <component>` invocation.
struct WitRenderResult {
  std::string wit_text;
  std::string stderr_text;
  int exit_code = -1;
};

// Runs `<tool> component wit <component_path>` synchronously and captures
// stdout as the WIT text. No timeout: a hung tool hangs the caller.
//
// Contract:
// - returns true only when the process ran, exited 0 and printed valid UTF-8.
// - returns false with `error` naming the tool and, for non-zero exits, the
//   tool's stderr (exit 127 is reported as "not found").
bool RenderComponentWit(const std::filesystem::path& component_path, const std::string& tool,
                        WitRenderResult& result, std::string& error);

} // namespace witdocs::wit
