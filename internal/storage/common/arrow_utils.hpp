#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "config/config.pb.h"

namespace uploader::storage::common {

/*
  Arrow reports failures as Status; the uploader reports them as
  exceptions. `context` names the operation, e.g. "open IMAGE/a.jpg".
*/
inline std::string Describe(const arrow::Status& status, std::string_view context) {
  if (context.empty()) return status.ToString();
  return std::string(context) + ": " + status.ToString();
}

template <typename T>
T Unwrap(arrow::Result<T> result, std::string_view context = {}) {
  if (!result.ok()) throw std::runtime_error(Describe(result.status(), context));
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, std::string_view context = {}) {
  if (!status.ok()) throw std::runtime_error(Describe(status, context));
}

/*
  True for S3 errors that no retry will fix: bad credentials, bad
  signature, denied bucket access.
*/
bool IsAuthError(const std::string& message);

/*
  Build the filesystem named by ObjectStorageConfig.

  Returns the filesystem and the root every object key is placed under
  (the bucket for S3, a directory for LOCAL).
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const uploader::runtime::config::ObjectStorageConfig& config);

} // namespace uploader::storage::common
