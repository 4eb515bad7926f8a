#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <array>
#include <filesystem>
#include <string_view>

namespace uploader::storage::common {

namespace {

constexpr std::array<std::string_view, 5> kAuthMarkers = {
    "AccessDenied", "SignatureDoesNotMatch", "InvalidAccessKeyId", "ExpiredToken", "InvalidToken",
};

arrow::fs::S3Options ToS3Options(const uploader::runtime::config::S3Options& proto_options) {
  arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();

  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key(), proto_options.session_token());
  }
  if (!proto_options.region().empty()) {
    options.region = proto_options.region();
  }
  if (!proto_options.scheme().empty()) {
    options.scheme = proto_options.scheme();
  }
  if (proto_options.connect_timeout() > 0) {
    options.connect_timeout = proto_options.connect_timeout();
  }
  if (proto_options.request_timeout() > 0) {
    options.request_timeout = proto_options.request_timeout();
  }
  options.endpoint_override        = proto_options.endpoint_override();
  options.force_virtual_addressing = proto_options.force_virtual_addressing();
  return options;
}

// "s3://bucket/prefix" and "bucket/prefix" both mean bucket/prefix
std::string StripScheme(const std::string& root_path) {
  constexpr std::string_view kScheme = "s3://";
  if (root_path.rfind(kScheme, 0) == 0) {
    return root_path.substr(kScheme.size());
  }
  return root_path;
}

} // namespace

bool IsAuthError(const std::string& message) {
  for (auto marker : kAuthMarkers) {
    if (message.find(marker) != std::string::npos) return true;
  }
  return false;
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const uploader::runtime::config::ObjectStorageConfig& config) {
  std::string resolved_path = config.root_path();
  if (resolved_path.empty()) {
    return arrow::Status::Invalid("object_storage.root_path must be set");
  }

  switch (config.filesystem()) {
    case uploader::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                            std::filesystem::absolute(resolved_path).generic_string());

    case uploader::runtime::config::FILE_SYSTEM_S3: {
      ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(ToS3Options(config.s3())));
      return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), StripScheme(resolved_path));
    }

    case uploader::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      if (resolved_path.rfind("s3://", 0) == 0) {
        ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace uploader::storage::common
