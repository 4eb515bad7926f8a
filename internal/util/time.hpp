#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace uploader::util {

/*
  Clock source and conversions between it, protobuf and calendar dates.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// "YYYY-MM-DD" in the local calendar; throws std::invalid_argument on bad input.
std::chrono::year_month_day ParseDate(const std::string& text);

} // namespace uploader::util
