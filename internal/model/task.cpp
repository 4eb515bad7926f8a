#include "task.hpp"

#include <cstdio>

namespace uploader::model {

std::string OrderPrefix(std::string_view order_number, std::chrono::year_month_day date) {
  const int      year  = static_cast<int>(date.year());
  const unsigned month = static_cast<unsigned>(date.month());
  const unsigned day   = static_cast<unsigned>(date.day());

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04d/%02u-%04d/%02u-%02u-%04d/Order_", year, month, year, day, month, year);
  return std::string(buffer) + std::string(order_number);
}

} // namespace uploader::model
