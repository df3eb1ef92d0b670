#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace jobq::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("5" for a string field)
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
      // "memory:" with no body selects the empty message
      value->mutable_struct_value();
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
// Public loader
// ------------------------------------------------------------

jobq::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  jobq::runtime::config::RuntimeConfig config;

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path("~/.jobq/data/jobq.db");
  sqlite->set_busy_timeout_ms(5000);

  config.mutable_logging()->set_level("info");

  auto* workers = config.mutable_workers();
  workers->set_poll_interval_ms(1000);
  workers->set_registry_path("~/.jobq/data/workers.json");
  workers->set_kill_grace_ms(2000);

  auto* defaults = config.mutable_job_defaults();
  defaults->set_max_retries(3);
  defaults->set_timeout_seconds(20);
  defaults->set_backoff_base(2);
  defaults->set_priority(5);

  return config;
}

jobq::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json_status.ToString());
  }

  jobq::runtime::config::RuntimeConfig parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + status.ToString());
  }

  // proto3 merge: only fields present in the file override the defaults
  auto config = Defaults();
  config.MergeFrom(parsed);
  return config;
}

} // namespace jobq::config
