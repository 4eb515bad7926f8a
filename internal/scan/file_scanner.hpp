#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/model/manifest.hpp"

namespace uploader::scan {

struct ScanOptions {
  // Joined with the root-relative path to form each remote key.
  std::string remote_prefix;

  // Move files sitting directly under the root into <root>/<CATEGORY>/.
  bool relocate_loose_files = true;
};

struct ScanResult {
  model::Manifest manifest;

  std::size_t relocated_files = 0;
  std::size_t excluded_files  = 0;
};

/*
  Builds the transfer manifest for a task root.

  - dotfiles, OS metadata and partial downloads are skipped
  - any directory named "Archive" (case-insensitive) is pruned at every depth
  - loose files are relocated before the walk, so the manifest always
    describes the organized layout
  - entries are sorted by root-relative path (byte order)

  Throws util::PathNotFound when the root is missing and
  util::PermissionDenied when a directory cannot be read or a loose file
  cannot be moved.
*/
class FileScanner {
 public:
  explicit FileScanner(ScanOptions options);

  ScanResult Scan(const std::filesystem::path& root) const;

  static bool        IsExcludedName(std::string_view file_name);
  static bool        IsArchiveDirectory(std::string_view directory_name);
  static std::string JoinKey(std::string_view prefix, std::string_view relative_path);

 private:
  std::filesystem::path Relocate(const std::filesystem::path& root, const std::filesystem::path& file) const;

  ScanOptions options_;
};

} // namespace uploader::scan
