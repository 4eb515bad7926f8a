#include "internal/engine/progress_accumulator.hpp"

#include <filesystem>

namespace uploader::engine {

double ProgressSnapshot::Percent() const {
  if (total_bytes > 0) {
    auto done = uploaded_bytes + skipped_bytes + in_flight_bytes;
    if (done >= total_bytes) return 100.0;
    return 100.0 * static_cast<double>(done) / static_cast<double>(total_bytes);
  }
  if (total_files == 0) {
    return state == model::WorkerState::kCompleted ? 100.0 : 0.0;
  }
  return 100.0 * static_cast<double>(files_processed) / static_cast<double>(total_files);
}

ProgressAccumulator::ProgressAccumulator(ProgressOptions options) : options_(options) {
  if (options_.step_percent == 0 || options_.step_percent > 100) {
    options_.step_percent = 5;
  }
}

void ProgressAccumulator::SetHandler(ProgressHandler handler) {
  std::scoped_lock lock(mutex_);
  handler_ = std::move(handler);
}

void ProgressAccumulator::Reset(uint64_t total_files, uint64_t total_bytes) {
  std::scoped_lock lock(mutex_);
  auto             state = snapshot_.state;
  snapshot_              = ProgressSnapshot{};
  snapshot_.total_files  = total_files;
  snapshot_.total_bytes  = total_bytes;
  snapshot_.state        = state;
  last_emitted_sent_     = 0;
  final_emitted_         = false;
}

void ProgressAccumulator::Restore(const ResumedWork& done) {
  std::scoped_lock lock(mutex_);
  snapshot_.files_processed = done.files_processed;
  snapshot_.files_uploaded  = done.files_uploaded;
  snapshot_.files_skipped   = done.files_skipped;
  snapshot_.files_failed    = done.files_failed;
  snapshot_.uploaded_bytes  = done.uploaded_bytes;
  snapshot_.skipped_bytes   = done.skipped_bytes;
}

void ProgressAccumulator::SetState(model::WorkerState state) {
  ProgressSnapshot copy;
  {
    std::scoped_lock lock(mutex_);
    if (snapshot_.state == state) return;
    snapshot_.state = state;
    copy            = snapshot_;
  }
  Emit(copy);
}

void ProgressAccumulator::BeginFile(const model::ManifestEntry& entry) {
  std::scoped_lock lock(mutex_);
  snapshot_.current_file      = std::filesystem::path(entry.local_path).filename().string();
  snapshot_.current_file_sent = 0;
  snapshot_.current_file_size = entry.size_bytes;
  snapshot_.in_flight_bytes   = 0;
  last_emitted_sent_          = 0;
  final_emitted_              = false;
}

void ProgressAccumulator::OnBytes(uint64_t sent, uint64_t total) {
  ProgressSnapshot copy;
  {
    std::scoped_lock lock(mutex_);
    snapshot_.current_file_sent = sent;
    snapshot_.current_file_size = total;
    snapshot_.in_flight_bytes   = sent;

    bool emit = false;
    if (sent >= total) {
      emit           = !final_emitted_;
      final_emitted_ = true;
    } else if (total < options_.small_file_threshold_bytes) {
      emit = true;
    } else {
      const uint64_t step = total * options_.step_percent / 100;
      emit                = sent - last_emitted_sent_ >= (step == 0 ? 1 : step);
    }

    if (!emit) return;
    last_emitted_sent_ = sent;
    copy               = snapshot_;
  }
  Emit(copy);
}

void ProgressAccumulator::EndFile() {
  snapshot_.files_processed++;
  snapshot_.in_flight_bytes   = 0;
  snapshot_.current_file_sent = 0;
}

void ProgressAccumulator::FileUploaded(const model::ManifestEntry& entry) {
  ProgressSnapshot copy;
  {
    std::scoped_lock lock(mutex_);
    EndFile();
    snapshot_.files_uploaded++;
    snapshot_.uploaded_bytes += entry.size_bytes;
    copy = snapshot_;
  }
  Emit(copy);
}

void ProgressAccumulator::FileSkipped(const model::ManifestEntry& entry) {
  ProgressSnapshot copy;
  {
    std::scoped_lock lock(mutex_);
    EndFile();
    snapshot_.files_skipped++;
    snapshot_.skipped_bytes += entry.size_bytes;
    copy = snapshot_;
  }
  Emit(copy);
}

void ProgressAccumulator::FileFailed(const model::ManifestEntry&) {
  ProgressSnapshot copy;
  {
    std::scoped_lock lock(mutex_);
    EndFile();
    snapshot_.files_failed++;
    copy = snapshot_;
  }
  Emit(copy);
}

ProgressSnapshot ProgressAccumulator::Snapshot() const {
  std::scoped_lock lock(mutex_);
  return snapshot_;
}

uint64_t ProgressAccumulator::EventsEmitted() const {
  std::scoped_lock lock(mutex_);
  return events_;
}

void ProgressAccumulator::Emit(const ProgressSnapshot& snapshot) {
  ProgressHandler handler;
  {
    std::scoped_lock lock(mutex_);
    events_++;
    handler = handler_;
  }
  if (handler) handler(snapshot);
}

} // namespace uploader::engine
