#include "object_arrow_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace uploader::storage {

using namespace uploader::storage::common;

namespace {

[[noreturn]] void Rethrow(const std::string& key, const std::string& message) {
  if (IsAuthError(message)) {
    throw util::RemoteStoreUnreachable("object store rejected credentials for " + key + ": " + message);
  }
  throw std::runtime_error("upload " + key + ": " + message);
}

} // namespace

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, uint64_t chunk_size)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), chunk_size_(chunk_size == 0 ? 256 * 1024 : chunk_size) {
}

/*
  Object key layout:

      <root_path>/<remote_key>
*/
std::string ObjectArrowStore::ObjectPath(const std::string& key) const {
  if (key.empty() || key.front() == '/') {
    throw std::invalid_argument("object key must be relative and non-empty: '" + key + "'");
  }
  return JoinObjectPath(root_path_, key);
}

bool ObjectArrowStore::IsLocal() const {
  return fs_->type_name() == "local";
}

/*
  Local targets are created on demand. A remote bucket must already exist.
*/
void ObjectArrowStore::CheckReachable() {
  if (IsLocal()) {
    auto status = fs_->CreateDir(root_path_, /*recursive=*/true);
    if (!status.ok()) throw util::RemoteStoreUnreachable("cannot create " + root_path_ + ": " + status.ToString());
    return;
  }

  auto info = fs_->GetFileInfo(root_path_);
  if (!info.ok()) {
    throw util::RemoteStoreUnreachable("object store unreachable at " + root_path_ + ": " + info.status().ToString());
  }
  if (info->type() == arrow::fs::FileType::NotFound) {
    throw util::RemoteStoreUnreachable("bucket not found: " + root_path_);
  }
}

bool ObjectArrowStore::Exists(const std::string& key) {
  auto info = fs_->GetFileInfo(ObjectPath(key));
  if (!info.ok()) Rethrow(key, info.status().ToString());
  return info->type() == arrow::fs::FileType::File;
}

/*
  Stream the file:
      open local → open remote → copy chunks → close

  A failed copy aborts the output stream so no partial object is
  published under the key.
*/
void ObjectArrowStore::Upload(const std::string& key, const std::string& local_path, const std::string& content_type,
                              const ByteProgressCallback& progress) {
  const auto path = ObjectPath(key);

  auto       input = Unwrap(arrow::io::ReadableFile::Open(local_path), "open " + local_path);
  const auto total = static_cast<uint64_t>(Unwrap(input->GetSize(), "stat " + local_path));

  if (IsLocal()) {
    auto parent = path.substr(0, path.find_last_of('/'));
    Unwrap(fs_->CreateDir(parent, /*recursive=*/true), "create " + parent);
  }

  std::shared_ptr<const arrow::KeyValueMetadata> metadata;
  if (!content_type.empty()) {
    metadata = arrow::key_value_metadata({"Content-Type"}, {content_type});
  }

  auto output_result = fs_->OpenOutputStream(path, metadata);
  if (!output_result.ok()) Rethrow(key, output_result.status().ToString());
  auto output = *output_result;

  uint64_t sent = 0;
  auto     fail = [&](const arrow::Status& status) {
    auto abort_status = output->Abort();
    if (!abort_status.ok()) {
      UPLOADER_LOG_WARN("abort of partial upload failed", {observability::StringField("key", key),
                                                            observability::StringField("error", abort_status.ToString())});
    }
    input->Close().Warn();
    Rethrow(key, status.ToString());
  };

  while (sent < total) {
    auto chunk = input->Read(static_cast<int64_t>(std::min<uint64_t>(chunk_size_, total - sent)));
    if (!chunk.ok()) fail(chunk.status());
    if ((*chunk)->size() == 0) fail(arrow::Status::IOError("file shrank while reading: ", local_path));

    auto status = output->Write(*chunk);
    if (!status.ok()) fail(status);

    sent += static_cast<uint64_t>((*chunk)->size());
    if (progress) progress(sent, total);
  }

  auto status = output->Close();
  if (!status.ok()) fail(status);
  Unwrap(input->Close(), "close " + local_path);

  // empty files still report completion once
  if (total == 0 && progress) progress(0, 0);
}

} // namespace uploader::storage
