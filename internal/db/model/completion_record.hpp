#pragma once

#include <cstdint>
#include <string>

namespace uploader::db::model {

/*
  One transferred (or verified-present) object.

  Keyed by (task_id, remote_key). Written only after the object store
  accepted the whole file.
*/

struct CompletionRecord {
  std::string task_id;
  std::string remote_key;

  std::string file_name;
  uint64_t    file_size = 0;

  // raw | image | video | other
  std::string file_type;

  // uploaded | skipped
  std::string status;

  uint64_t uploaded_at_ms = 0;
};

} // namespace uploader::db::model
