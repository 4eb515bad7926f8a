#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "internal/model/manifest.hpp"
#include "internal/model/state_machine.hpp"

namespace uploader::engine {

struct ProgressSnapshot {
  uint64_t total_files     = 0;
  uint64_t files_processed = 0;
  uint64_t files_uploaded  = 0;
  uint64_t files_skipped   = 0;
  uint64_t files_failed    = 0;

  uint64_t total_bytes     = 0;
  uint64_t uploaded_bytes  = 0;
  uint64_t skipped_bytes   = 0;
  uint64_t in_flight_bytes = 0;

  std::string current_file;
  uint64_t    current_file_sent = 0;
  uint64_t    current_file_size = 0;

  model::WorkerState state = model::WorkerState::kIdle;

  // 0..100 over bytes; over files when the manifest holds no bytes
  double Percent() const;
};

using ProgressHandler = std::function<void(const ProgressSnapshot&)>;

// Work a previous run finished before the cursor a resumed run starts at.
struct ResumedWork {
  uint64_t files_processed = 0;
  uint64_t files_uploaded  = 0;
  uint64_t files_skipped   = 0;
  uint64_t files_failed    = 0;
  uint64_t uploaded_bytes  = 0;
  uint64_t skipped_bytes   = 0;
};

struct ProgressOptions {
  uint32_t step_percent               = 5;
  uint64_t small_file_threshold_bytes = 1024 * 1024;
};

/*
  Turns byte and file events into progress snapshots.

  Byte callbacks are throttled per file: one event per step_percent of the
  file size, every callback for files under small_file_threshold_bytes,
  and always one when the file reaches 100%. File outcome events are never
  throttled.

  Mutated by the worker thread, Snapshot() is safe from any thread. The
  handler runs on the mutating thread without the lock held.
*/
class ProgressAccumulator {
 public:
  explicit ProgressAccumulator(ProgressOptions options = {});

  void SetHandler(ProgressHandler handler);

  void Reset(uint64_t total_files, uint64_t total_bytes);

  // Call after Reset(); emits nothing.
  void Restore(const ResumedWork& done);
  void SetState(model::WorkerState state);

  void BeginFile(const model::ManifestEntry& entry);
  void OnBytes(uint64_t sent, uint64_t total);

  void FileUploaded(const model::ManifestEntry& entry);
  void FileSkipped(const model::ManifestEntry& entry);
  void FileFailed(const model::ManifestEntry& entry);

  ProgressSnapshot Snapshot() const;

  uint64_t EventsEmitted() const;

 private:
  void Emit(const ProgressSnapshot& snapshot);
  void EndFile();

  ProgressOptions options_;

  mutable std::mutex mutex_;
  ProgressSnapshot   snapshot_;
  uint64_t           last_emitted_sent_ = 0;
  bool               final_emitted_     = false;
  uint64_t           events_            = 0;
  ProgressHandler    handler_;
};

} // namespace uploader::engine
