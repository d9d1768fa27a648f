#pragma once

namespace witdocs::core::errors {

// Process-exit contract shared by `wit-docs-inject` and `wit-docs-view`.
//
// 0/1/2 keep their conventional script meanings. The remaining values name
// the failing step so wrappers can branch without scraping stderr:
// - kNoDocs: the component carries no `package-docs` section (view only)
// - kIo: reading or writing a file failed
// - kParse: module framing or docs payload/source is malformed
// - kSubprocess: the external WIT rendering tool failed
// - kEncoding: the docs tree could not be serialized
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kNoDocs = 3,
  kIo = 10,
  kParse = 11,
  kSubprocess = 12,
  kEncoding = 13,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace witdocs::core::errors
