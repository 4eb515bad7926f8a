#pragma once

#include <cstdint>
#include <string_view>

namespace uploader::model {

enum class FileCategory : std::uint8_t {
  kRawImage = 0,
  kImage    = 1,
  kVideo    = 2,
  kOther    = 3,
};

// Folder name used both on disk (<root>/<folder>/...) and in remote keys.
constexpr std::string_view FolderName(FileCategory category) {
  switch (category) {
    case FileCategory::kRawImage:
      return "RAW";
    case FileCategory::kImage:
      return "IMAGE";
    case FileCategory::kVideo:
      return "VIDEO";
    case FileCategory::kOther:
    default:
      return "OTHER";
  }
}

constexpr std::string_view ToString(FileCategory category) {
  switch (category) {
    case FileCategory::kRawImage:
      return "raw";
    case FileCategory::kImage:
      return "image";
    case FileCategory::kVideo:
      return "video";
    case FileCategory::kOther:
    default:
      return "other";
  }
}

} // namespace uploader::model
