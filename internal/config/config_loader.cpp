#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace uploader::config {

namespace {

constexpr uint32_t kDefaultSaveIntervalEntries    = 10;
constexpr uint32_t kDefaultPausePollIntervalMs    = 250;
constexpr uint64_t kDefaultChunkSizeBytes         = 256 * 1024;
constexpr uint32_t kDefaultCompletionFlushRecords = 500;
constexpr uint32_t kDefaultProgressStepPercent    = 5;
constexpr uint64_t kDefaultSmallFileThreshold     = 1024 * 1024;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0.0.0.0", "007")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* checkpoint = config->mutable_checkpoint();
  if (checkpoint->directory().empty()) {
    const char* home = std::getenv("HOME");
    checkpoint->set_directory(std::string(home ? home : ".") + "/.order_uploader");
  }
  if (checkpoint->save_interval_entries() == 0) {
    checkpoint->set_save_interval_entries(kDefaultSaveIntervalEntries);
  }

  auto* transfer = config->mutable_transfer();
  if (transfer->pause_poll_interval_ms() == 0) {
    transfer->set_pause_poll_interval_ms(kDefaultPausePollIntervalMs);
  }
  if (transfer->chunk_size_bytes() == 0) {
    transfer->set_chunk_size_bytes(kDefaultChunkSizeBytes);
  }
  if (transfer->completion_flush_threshold() == 0) {
    transfer->set_completion_flush_threshold(kDefaultCompletionFlushRecords);
  }

  auto* progress = config->mutable_progress();
  if (progress->step_percent() == 0 || progress->step_percent() > 100) {
    progress->set_step_percent(kDefaultProgressStepPercent);
  }
  if (progress->small_file_threshold_bytes() == 0) {
    progress->set_small_file_threshold_bytes(kDefaultSmallFileThreshold);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& storage = config.object_storage();
  if (storage.filesystem() == uploader::runtime::config::FILE_SYSTEM_S3 && storage.root_path().empty()) {
    throw std::invalid_argument("object_storage.root_path: S3 bucket name is required");
  }

  const auto& ledger = config.ledger();
  if (ledger.has_sqlite() && ledger.sqlite().path().empty()) {
    throw std::invalid_argument("ledger.sqlite.path must not be empty");
  }
  if (ledger.has_postgres() && ledger.postgres().connection_uri().empty()) {
    throw std::invalid_argument("ledger.postgres.connection_uri must not be empty");
  }

  if (config.checkpoint().directory().empty()) {
    throw std::invalid_argument("checkpoint.directory must not be empty");
  }
}

} // namespace uploader::config
