#include "file_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/scan/file_classifier.hpp"
#include "internal/util/errors.hpp"

namespace uploader::scan {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::array<std::string_view, 4> kMetadataNames = {"thumbs.db", "desktop.ini", "ehthumbs.db", "icon\r"};

constexpr std::array<std::string_view, 3> kPartialSuffixes = {".tmp", ".crdownload", ".part"};

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

[[noreturn]] void ThrowTranslated(const fs::filesystem_error& e) {
  const auto code = e.code();
  if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
    throw util::PermissionDenied(e.what());
  }
  if (code == std::errc::no_such_file_or_directory || code == std::errc::not_a_directory) {
    throw util::PathNotFound(e.what());
  }
  throw e;
}

struct PendingEntry {
  std::string          relative;
  model::ManifestEntry entry;
};

} // namespace

FileScanner::FileScanner(ScanOptions options) : options_(std::move(options)) {
}

bool FileScanner::IsExcludedName(std::string_view file_name) {
  if (file_name.empty() || file_name.front() == '.') {
    return true;
  }

  const auto lower = Lower(file_name);
  if (std::find(kMetadataNames.begin(), kMetadataNames.end(), lower) != kMetadataNames.end()) {
    return true;
  }
  return std::any_of(kPartialSuffixes.begin(), kPartialSuffixes.end(), [&](std::string_view suffix) { return EndsWith(lower, suffix); });
}

bool FileScanner::IsArchiveDirectory(std::string_view directory_name) {
  return Lower(directory_name) == "archive";
}

std::string FileScanner::JoinKey(std::string_view prefix, std::string_view relative_path) {
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.remove_suffix(1);
  }
  while (!relative_path.empty() && relative_path.front() == '/') {
    relative_path.remove_prefix(1);
  }

  if (prefix.empty()) {
    return std::string(relative_path);
  }
  std::string key;
  key.reserve(prefix.size() + relative_path.size() + 1);
  key.append(prefix);
  key.push_back('/');
  key.append(relative_path);
  return key;
}

/*
  Move a loose file into its category folder.

  An existing file with the same name is never overwritten; the moved file
  gets a " (n)" suffix instead.
*/
fs::path FileScanner::Relocate(const fs::path& root, const fs::path& file) const {
  const auto category = Classify(file.extension().string());
  const auto folder   = root / std::string(model::FolderName(category));
  fs::create_directories(folder);

  auto target = folder / file.filename();
  for (int n = 1; fs::exists(target); ++n) {
    target = folder / (file.stem().string() + " (" + std::to_string(n) + ")" + file.extension().string());
  }

  fs::rename(file, target);
  UPLOADER_LOG_INFO("relocated loose file", {StringField("from", file.string()), StringField("to", target.string())});
  return target;
}

ScanResult FileScanner::Scan(const fs::path& root_path) const {
  std::error_code ec;
  if (!fs::exists(root_path, ec) || !fs::is_directory(root_path, ec)) {
    throw util::PathNotFound("task root does not exist: " + root_path.string());
  }

  const auto root = fs::absolute(root_path).lexically_normal();

  ScanResult                      result;
  std::unordered_set<std::string> relocated;
  std::vector<PendingEntry>       pending;

  try {
    if (options_.relocate_loose_files) {
      std::vector<fs::path> loose;
      for (const auto& item : fs::directory_iterator(root)) {
        if (item.is_regular_file() && !IsExcludedName(item.path().filename().string())) {
          loose.push_back(item.path());
        }
      }
      std::sort(loose.begin(), loose.end());

      for (const auto& file : loose) {
        const auto target = Relocate(root, file);
        relocated.insert(target.lexically_relative(root).generic_string());
      }
      result.relocated_files = loose.size();
    }

    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
      const auto name = it->path().filename().string();

      if (it->is_directory()) {
        if (IsArchiveDirectory(name) || (!name.empty() && name.front() == '.')) {
          it.disable_recursion_pending();
        }
        continue;
      }
      if (!it->is_regular_file()) {
        continue;
      }
      if (IsExcludedName(name)) {
        ++result.excluded_files;
        continue;
      }

      PendingEntry item;
      item.relative = it->path().lexically_relative(root).generic_string();

      auto& entry      = item.entry;
      entry.local_path = it->path().string();
      entry.remote_key = JoinKey(options_.remote_prefix, item.relative);
      entry.size_bytes = it->file_size();
      entry.extension  = NormalizeExtension(it->path().extension().string());
      entry.category   = Classify(entry.extension);
      entry.origin     = (relocated.count(item.relative) > 0 || item.relative.find('/') == std::string::npos) ? model::Origin::kLoose
                                                                                                               : model::Origin::kOrganized;
      pending.push_back(std::move(item));
    }
  } catch (const fs::filesystem_error& e) {
    ThrowTranslated(e);
  }

  std::sort(pending.begin(), pending.end(), [](const PendingEntry& a, const PendingEntry& b) { return a.relative < b.relative; });

  result.manifest.reserve(pending.size());
  for (auto& item : pending) {
    result.manifest.push_back(std::move(item.entry));
  }

  UPLOADER_LOG_INFO("scan complete",
                    {StringField("root", root.string()), IntField("files", static_cast<std::int64_t>(result.manifest.size())),
                     IntField("relocated", static_cast<std::int64_t>(result.relocated_files)),
                     IntField("excluded", static_cast<std::int64_t>(result.excluded_files))});
  return result;
}

} // namespace uploader::scan
