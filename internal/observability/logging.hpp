#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace uploader::runtime::config {
class RuntimeConfig;
}

namespace uploader::observability {

/*
  Key/value pair appended to a log line.

  Lines are written as

    uploaded key=IMAGE/a.jpg bytes=42 file="a (1).jpg"

  so they stay greppable per field. The same text is handed to the
  worker's OnLog observers.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField PercentField(std::string_view key, double value);

// Console sink always; file sink when logging.file or UPLOADER_LOG_FILE is set.
void InitializeLogging(const uploader::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace uploader::observability

#define UPLOADER_LOG_DEBUG(message, ...) ::uploader::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define UPLOADER_LOG_INFO(message, ...) ::uploader::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define UPLOADER_LOG_WARN(message, ...) ::uploader::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define UPLOADER_LOG_ERROR(message, ...) ::uploader::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
