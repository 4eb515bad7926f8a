#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace uploader::storage::common {

inline void ValidateTaskId(const std::string& task_id) {
  if (task_id.empty()) {
    throw std::invalid_argument("task id must not be empty");
  }
  for (char c : task_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("task id contains invalid character");
    }
  }
  if (task_id == "." || task_id == "..") {
    throw std::invalid_argument("task id must not be a relative path component");
  }
}

/*
  <dir>/task_state_<task_id>.json[suffix]
*/
inline std::filesystem::path CheckpointPath(const std::filesystem::path& dir, const std::string& task_id, const std::string& suffix = {}) {
  ValidateTaskId(task_id);
  return dir / ("task_state_" + task_id + ".json" + suffix);
}

// Object keys always use '/', whatever the host separator is.
inline std::string JoinObjectPath(const std::string& root, const std::string& key) {
  if (root.empty()) return key;
  if (root.back() == '/') return root + key;
  return root + "/" + key;
}

} // namespace uploader::storage::common
