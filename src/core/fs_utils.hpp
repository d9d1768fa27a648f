#ifndef WITDOCS_CORE_FS_UTILS_HPP_
#define WITDOCS_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace witdocs::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path,
                                                  std::string_view tag = ".tmp.") {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + std::string(tag) + std::to_string(tick) + "." +
         std::to_string(suffix);
}

} // namespace detail

inline bool ReadBinaryFile(const std::filesystem::path& path, std::vector<std::uint8_t>& bytes,
                           std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to open file '" + path.string() + "'";
    return false;
  }

  bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to open file '" + path.string() + "'";
    return false;
  }

  contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Atomic publish of a byte buffer:
// 1) write the full payload to a temporary sibling file
// 2) rename the temp file over the destination
//
// Readers of `output_path` (including the in-place case where it is also the
// input) never observe a half-written module. When the direct rename fails the
// existing destination is moved aside, then restored if the retry fails too.
inline bool WriteFileAtomic(const std::filesystem::path& output_path, std::string_view bytes,
                            std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  std::error_code status_ec;
  if (std::filesystem::is_directory(output_path, status_ec)) {
    error = "output path '" + output_path.string() + "' is a directory";
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out_file.flush();
    if (!out_file) {
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::filesystem::path backup_path;
  std::error_code exists_ec;
  if (std::filesystem::exists(output_path, exists_ec)) {
    backup_path = detail::BuildAtomicTempPath(output_path, ".bak.");
    std::error_code backup_ec;
    std::filesystem::rename(output_path, backup_path, backup_ec);
    if (backup_ec) {
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed to publish output file '" + output_path.string() +
              "': " + rename_ec.message();
      return false;
    }
  }

  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    if (!backup_path.empty()) {
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(backup_path, cleanup_ec);
    }
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  if (!backup_path.empty()) {
    std::error_code restore_ec;
    std::filesystem::rename(backup_path, output_path, restore_ec);
    if (restore_ec) {
      error += "; previous contents kept at '" + backup_path.string() + "'";
    }
  }
  return false;
}

inline bool WriteFileAtomic(const std::filesystem::path& output_path,
                            const std::vector<std::uint8_t>& bytes, std::string& error) {
  return WriteFileAtomic(
      output_path,
      std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()),
      error);
}

} // namespace witdocs::core

#endif // WITDOCS_CORE_FS_UTILS_HPP_
