#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace uploader::model {

enum class TaskStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kPaused    = 2,
  kCompleted = 3,
  kCancelled = 4,
  kFailed    = 5,
};

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kPaused:
      return "paused";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kCancelled:
      return "cancelled";
    case TaskStatus::kFailed:
    default:
      return "failed";
  }
}

/*
  Upload request for one order folder.

  remote_prefix is joined with the root-relative path of every file to form
  its object key.
*/
struct Task {
  std::string task_id;
  std::string remote_prefix;
  std::string local_root;

  std::chrono::system_clock::time_point created_at{};
  TaskStatus                            status = TaskStatus::kPending;
};

// Order layout used by the studio: YYYY/MM-YYYY/DD-MM-YYYY/Order_<number>
std::string OrderPrefix(std::string_view order_number, std::chrono::year_month_day date);

} // namespace uploader::model
