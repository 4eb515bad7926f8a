#pragma once

#include <memory>
#include <string>

#include <arrow/filesystem/filesystem.h>

#include "internal/storage/object_store.hpp"

namespace uploader::storage {

/*
  Object storage (S3 / MinIO, or a local directory) using the Arrow
  filesystem layer.

  Characteristics:
    - one streamed PUT per file, read in chunk_size pieces
    - no multipart orchestration beyond what the filesystem does
    - Content-Type carried as stream metadata (ignored by local targets)
*/

class ObjectArrowStore final : public ObjectStore {
public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, uint64_t chunk_size);

  void CheckReachable() override;

  bool Exists(const std::string& key) override;

  void Upload(const std::string& key, const std::string& local_path, const std::string& content_type,
              const ByteProgressCallback& progress) override;

private:
  std::string ObjectPath(const std::string& key) const;
  bool IsLocal() const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
  uint64_t chunk_size_;
};

}
