#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace jwlmerge::config {

using jwlmerge::runtime::config::RuntimeConfig;

namespace {

constexpr const char*    kDefaultPattern          = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr int            kDefaultCompressionLevel = 6;
constexpr std::uint64_t  kDefaultMaxEntryBytes    = 1ull << 30;
constexpr std::uint32_t  kDefaultBusyTimeoutMs    = 5000;
constexpr std::array     kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

bool IsPlainFileName(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("" for temp_root, "0600" style names)
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

// ------------------------------------------------------------
// Defaults and validation
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_pattern(kDefaultPattern);
  config.mutable_logging()->set_file_directory("logs");
  config.mutable_logging()->set_file_level("debug");
  config.mutable_workspace()->set_temp_root("");
  config.mutable_archive()->set_compression_level(kDefaultCompressionLevel);
  config.mutable_archive()->set_max_entry_bytes(kDefaultMaxEntryBytes);
  config.mutable_store()->set_default_database_name("userData.db");
  config.mutable_store()->set_manifest_name("manifest.json");
  config.mutable_store()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  config.mutable_output()->set_directory(".");
  return config;
}

void ConfigLoader::Finalize(RuntimeConfig* config) {
  const RuntimeConfig defaults = Defaults();

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level(defaults.logging().level());
  if (logging->pattern().empty()) logging->set_pattern(defaults.logging().pattern());
  if (logging->file_directory().empty()) logging->set_file_directory(defaults.logging().file_directory());
  if (logging->file_level().empty()) logging->set_file_level(defaults.logging().file_level());

  config->mutable_workspace();

  auto* archive = config->mutable_archive();
  if (!archive->has_compression_level()) archive->set_compression_level(defaults.archive().compression_level());
  if (!archive->has_max_entry_bytes()) archive->set_max_entry_bytes(defaults.archive().max_entry_bytes());

  auto* store = config->mutable_store();
  if (store->default_database_name().empty()) store->set_default_database_name(defaults.store().default_database_name());
  if (store->manifest_name().empty()) store->set_manifest_name(defaults.store().manifest_name());
  if (!store->has_busy_timeout_ms()) store->set_busy_timeout_ms(defaults.store().busy_timeout_ms());

  auto* output = config->mutable_output();
  if (output->directory().empty()) output->set_directory(defaults.output().directory());

  auto known_level = [](const std::string& value) {
    return std::find(kLogLevels.begin(), kLogLevels.end(), value) != kLogLevels.end();
  };
  if (!known_level(logging->level())) {
    Invalid("logging.level must be one of trace|debug|info|warn|error|critical|off, got " + logging->level());
  }
  if (!known_level(logging->file_level())) {
    Invalid("logging.file_level must be one of trace|debug|info|warn|error|critical|off, got " + logging->file_level());
  }

  if (archive->compression_level() < 0 || archive->compression_level() > 9) {
    Invalid("archive.compression_level must be 0-9, got " + std::to_string(archive->compression_level()));
  }
  if (archive->max_entry_bytes() == 0) Invalid("archive.max_entry_bytes must be positive");

  if (!IsPlainFileName(store->default_database_name())) Invalid("store.default_database_name must be a plain file name");
  if (!IsPlainFileName(store->manifest_name())) Invalid("store.manifest_name must be a plain file name");
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

  RuntimeConfig config;

  // an empty file is a valid config: all defaults
  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  Finalize(&config);
  return config;
}

} // namespace jwlmerge::config
