#pragma once

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"

namespace uploader::testing {

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path MakeTempDir(const std::string& name) {
  static std::atomic<int> counter{0};
  auto dir = std::filesystem::temp_directory_path() /
             ("order_uploader_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/*
  In-memory object store.

  - fail_keys: Upload throws std::runtime_error
  - auth_fail_keys: Upload throws util::RemoteStoreUnreachable
  - on_upload: runs on the worker thread before the object is stored
*/
class FakeObjectStore final : public storage::ObjectStore {
 public:
  void CheckReachable() override {
    if (!reachable) throw util::RemoteStoreUnreachable("fake store offline");
  }

  bool Exists(const std::string& key) override {
    std::scoped_lock lock(mutex_);
    return objects_.count(key) > 0;
  }

  void Upload(const std::string& key, const std::string& local_path, const std::string& content_type,
              const storage::ByteProgressCallback& progress) override {
    if (on_upload) on_upload(key);

    if (auth_fail_keys.count(key) > 0) throw util::RemoteStoreUnreachable("SignatureDoesNotMatch for " + key);
    if (fail_keys.count(key) > 0) throw std::runtime_error("injected failure for " + key);
    if (!std::filesystem::exists(local_path)) throw std::runtime_error("missing local file " + local_path);

    auto data = ReadFile(local_path);
    if (progress) progress(data.size(), data.size());

    std::scoped_lock lock(mutex_);
    objects_[key]       = data;
    content_types_[key] = content_type;
    uploads_.push_back(key);
  }

  void Put(const std::string& key, const std::string& data) {
    std::scoped_lock lock(mutex_);
    objects_[key] = data;
  }

  std::vector<std::string> Uploads() const {
    std::scoped_lock lock(mutex_);
    return uploads_;
  }

  std::string ContentType(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    auto it = content_types_.find(key);
    return it == content_types_.end() ? std::string() : it->second;
  }

  std::size_t ObjectCount() const {
    std::scoped_lock lock(mutex_);
    return objects_.size();
  }

  std::atomic<bool>                     reachable{true};
  std::unordered_set<std::string>       fail_keys;
  std::unordered_set<std::string>       auth_fail_keys;
  std::function<void(const std::string&)> on_upload;

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> objects_;
  std::map<std::string, std::string> content_types_;
  std::vector<std::string>           uploads_;
};

/*
  Ledger whose connection can be pulled. While unavailable every call
  throws, like a database that refuses connections.
*/
class FlakyLedger final : public db::LedgerRepository {
 public:
  explicit FlakyLedger(bool available_at_start = true) : available(available_at_start) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    Check();
    return inner.Begin();
  }

  bool TableExists(db::Transaction& tx, const std::string& table) override {
    Check();
    return inner.TableExists(tx, table);
  }

  std::vector<std::string> ListCompletedKeys(db::Transaction& tx, const std::string& task_id) override {
    Check();
    return inner.ListCompletedKeys(tx, task_id);
  }

  db::Result InsertCompletions(db::Transaction& tx, const std::vector<db::model::CompletionRecord>& records) override {
    Check();
    return inner.InsertCompletions(tx, records);
  }

  std::optional<db::model::TaskSummaryRecord> GetTaskSummary(db::Transaction& tx, const std::string& task_id) override {
    Check();
    return inner.GetTaskSummary(tx, task_id);
  }

  db::Result UpsertTaskSummary(db::Transaction& tx, const db::model::TaskSummaryRecord& record) override {
    Check();
    return inner.UpsertTaskSummary(tx, record);
  }

  std::vector<std::string> Keys(const std::string& task_id) {
    auto tx   = inner.Begin();
    auto keys = inner.ListCompletedKeys(*tx, task_id);
    tx->Commit();
    return keys;
  }

  std::optional<db::model::TaskSummaryRecord> Summary(const std::string& task_id) {
    auto tx      = inner.Begin();
    auto summary = inner.GetTaskSummary(*tx, task_id);
    tx->Commit();
    return summary;
  }

  std::atomic<bool>        available;
  db::memory::MemoryRepository inner;

 private:
  void Check() const {
    if (!available) throw std::runtime_error("could not connect to server: Connection refused");
  }
};

} // namespace uploader::testing
