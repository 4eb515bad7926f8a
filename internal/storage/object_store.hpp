#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace uploader::storage {

// (bytes sent so far, file size)
using ByteProgressCallback = std::function<void(uint64_t, uint64_t)>;

/*
  Destination of the transfer.

  Error contract:
    - CheckReachable() throws util::RemoteStoreUnreachable when the target cannot
      be used at all
    - Upload() throws util::RemoteStoreUnreachable on credential or
      permission errors and std::runtime_error for anything else
    - an object is visible under its key only after Upload() returned
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual void CheckReachable() = 0;

  virtual bool Exists(const std::string& key) = 0;

  virtual void Upload(const std::string& key, const std::string& local_path, const std::string& content_type,
                      const ByteProgressCallback& progress) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace uploader::storage
