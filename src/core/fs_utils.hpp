#ifndef TRACR_CORE_FS_UTILS_HPP_
#define TRACR_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace tracr::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

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
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }
  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

// Write-then-rename so readers never observe a half-written file:
// 1) write full content to a temporary sibling
// 2) rename the sibling over the destination
// If rename-overwrite is refused, remove+rename is attempted before giving up.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      error = "failed while writing temp file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Appends exactly one line (a trailing newline is added).
inline bool AppendLine(const std::filesystem::path& output_path, std::string_view line,
                       std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }
  std::ofstream out_file(output_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open '" + output_path.string() + "' for append";
    return false;
  }
  out_file << line << '\n';
  if (!out_file) {
    error = "failed while appending to '" + output_path.string() + "'";
    return false;
  }
  return true;
}

// `~` expansion against $HOME, used for controller-side config paths.
inline std::filesystem::path ExpandHome(const std::string& raw) {
  if (raw.empty() || raw.front() != '~') {
    return std::filesystem::path(raw);
  }
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::path(raw);
  }
  return std::filesystem::path(std::string(home) + raw.substr(1));
}

} // namespace tracr::core

#endif // TRACR_CORE_FS_UTILS_HPP_
