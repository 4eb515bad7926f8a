#include "file_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace uploader::scan {

namespace {

constexpr std::array<std::string_view, 11> kRawExtensions = {".cr2", ".cr3", ".nef", ".arw", ".raw", ".dng",
                                                             ".orf", ".pef", ".rw2", ".raf", ".srw"};

constexpr std::array<std::string_view, 11> kImageExtensions = {".jpg", ".jpeg", ".jpe",  ".png", ".tif", ".tiff",
                                                               ".heic", ".heif", ".webp", ".bmp", ".gif"};

constexpr std::array<std::string_view, 8> kVideoExtensions = {".mp4", ".mov", ".avi", ".mts", ".m2ts", ".mkv", ".m4v", ".3gp"};

constexpr std::array<std::pair<std::string_view, std::string_view>, 22> kContentTypes = {{
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".jpe", "image/jpeg"},
    {".png", "image/png"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".heic", "image/heic"},
    {".heif", "image/heif"},
    {".webp", "image/webp"},
    {".bmp", "image/bmp"},
    {".gif", "image/gif"},
    {".cr2", "image/x-canon-cr2"},
    {".cr3", "image/x-canon-cr3"},
    {".nef", "image/x-nikon-nef"},
    {".arw", "image/x-sony-arw"},
    {".dng", "image/x-adobe-dng"},
    {".mp4", "video/mp4"},
    {".m4v", "video/mp4"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".mkv", "video/x-matroska"},
    {".mts", "video/mp2t"},
}};

template <typename Table>
bool Contains(const Table& table, std::string_view value) {
  return std::find(table.begin(), table.end(), value) != table.end();
}

} // namespace

std::string NormalizeExtension(std::string_view extension) {
  if (extension.empty()) {
    return {};
  }

  std::string normalized;
  normalized.reserve(extension.size() + 1);
  if (extension.front() != '.') {
    normalized.push_back('.');
  }
  for (char c : extension) {
    normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return normalized;
}

model::FileCategory Classify(std::string_view extension) {
  const auto ext = NormalizeExtension(extension);
  if (Contains(kRawExtensions, ext)) return model::FileCategory::kRawImage;
  if (Contains(kImageExtensions, ext)) return model::FileCategory::kImage;
  if (Contains(kVideoExtensions, ext)) return model::FileCategory::kVideo;
  return model::FileCategory::kOther;
}

std::string_view ContentTypeFor(std::string_view extension) {
  const auto ext = NormalizeExtension(extension);
  for (const auto& [key, content_type] : kContentTypes) {
    if (key == ext) {
      return content_type;
    }
  }
  return "application/octet-stream";
}

} // namespace uploader::scan
