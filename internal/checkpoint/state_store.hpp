#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "uploader/v1/checkpoint.pb.h"

namespace uploader::checkpoint {

/*
  Durable per-task checkpoint.

  Layout under the checkpoint directory:

      task_state_<id>.json            primary
      task_state_<id>.json.bak        previous primary
      task_state_<id>.json.tmp        write in progress
      task_state_<id>.json.corrupted  quarantined primary

  Save():
      normalize → write tmp → fsync → copy primary to .bak → rename tmp

  Load():
      primary, then .bak, then .tmp. A good fallback is written back as the
      primary and the bad primary is kept as .corrupted. Nothing readable
      means "start fresh", never an error.
*/
class StateStore {
 public:
  explicit StateStore(std::filesystem::path directory);

  // Throws std::runtime_error when the checkpoint cannot be made durable.
  void Save(uploader::v1::Checkpoint checkpoint) const;

  std::optional<uploader::v1::Checkpoint> Load(const std::string& task_id) const;

  // Deletes every artifact of the task, quarantined files included.
  void Remove(const std::string& task_id) const;

  // Task ids that have a primary checkpoint, sorted.
  std::vector<std::string> ListTasks() const;

  std::filesystem::path PrimaryPath(const std::string& task_id) const;
  std::filesystem::path BackupPath(const std::string& task_id) const;
  std::filesystem::path TempPath(const std::string& task_id) const;
  std::filesystem::path QuarantinePath(const std::string& task_id) const;

  const std::filesystem::path& Directory() const {
    return directory_;
  }

  // Clamp cursor and byte counters into range, dedupe completed keys.
  static void Normalize(uploader::v1::Checkpoint* checkpoint);

 private:
  std::optional<uploader::v1::Checkpoint> Parse(const std::filesystem::path& path, const std::string& task_id) const;
  void WriteDurably(const std::filesystem::path& path, const std::string& contents) const;

  std::filesystem::path directory_;
};

} // namespace uploader::checkpoint
