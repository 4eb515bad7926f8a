#pragma once

#include <cstdint>
#include <string>

namespace uploader::db::model {

struct TaskSummaryRecord {
  std::string task_id;

  uint64_t uploaded_files = 0;
  uint64_t skipped_files  = 0;
  uint64_t failed_files   = 0;
  uint64_t uploaded_bytes = 0;

  // last run outcome (completed | cancelled | failed)
  std::string status;

  uint64_t updated_at_ms = 0;
};

} // namespace uploader::db::model
