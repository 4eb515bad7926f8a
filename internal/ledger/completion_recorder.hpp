#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/ledger_repository.hpp"
#include "internal/model/manifest.hpp"

namespace uploader::ledger {

inline constexpr std::string_view kStatusUploaded = "uploaded";
inline constexpr std::string_view kStatusSkipped  = "skipped";

// Counts produced by one run; added to (or replacing) the stored summary.
struct SessionSummary {
  uint64_t uploaded_files = 0;
  uint64_t skipped_files  = 0;
  uint64_t failed_files   = 0;
  uint64_t uploaded_bytes = 0;

  // completed | cancelled | failed
  std::string status;
};

/*
  Write side of the ledger.

  Records are buffered and committed in batches. A failed commit keeps
  the batch buffered for the next attempt: the objects are already
  stored remotely, only the bookkeeping is late.

  Not thread-safe; owned by the worker thread.
*/
class CompletionRecorder {
 public:
  CompletionRecorder(db::LedgerRepositoryPtr repository, std::string task_id, std::size_t flush_threshold);

  void Record(const model::ManifestEntry& entry, std::string_view status);

  // Commit the buffer once it reached the flush threshold.
  bool FlushIfFull();

  // Commit whatever is buffered. True when nothing is left pending.
  bool Flush();

  /*
    Commit buffered records and merge the run summary in one transaction.

    uploaded/skipped files and uploaded bytes are added to the stored
    row; failed files and status describe the latest run only.
  */
  bool Finalize(const SessionSummary& summary);

  std::size_t Pending() const {
    return pending_.size();
  }

 private:
  db::LedgerRepositoryPtr                repository_;
  std::string                            task_id_;
  std::size_t                            flush_threshold_;
  std::vector<db::model::CompletionRecord> pending_;
};

} // namespace uploader::ledger
