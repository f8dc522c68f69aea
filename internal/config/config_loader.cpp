#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace repricer::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // "!" is the non-specific tag yaml-cpp assigns to quoted scalars
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static repricer::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  repricer::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

repricer::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

repricer::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

static void RequireNonNegative(const google::protobuf::Duration& d, const char* name) {
  if (d.seconds() < 0 || d.nanos() < 0) {
    throw std::invalid_argument(std::string("engine.") + name + " must not be negative");
  }
}

void ConfigLoader::Validate(const repricer::runtime::config::RuntimeConfig& config) {
  const auto& engine = config.engine();
  RequireNonNegative(engine.message_lock_ttl(), "messageLockTtl");
  RequireNonNegative(engine.variant_lock_ttl(), "variantLockTtl");
  RequireNonNegative(engine.price_update_cooldown(), "priceUpdateCooldown");
  RequireNonNegative(engine.campaign_cooldown(), "campaignCooldown");
  RequireNonNegative(engine.self_echo_window(), "selfEchoWindow");
  RequireNonNegative(engine.rule_rearm_cooldown(), "ruleRearmCooldown");

  if (engine.has_cleanup_probability() && (engine.cleanup_probability() < 0.0 || engine.cleanup_probability() > 1.0)) {
    throw std::invalid_argument("engine.cleanupProbability must be within [0, 1]");
  }

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connectionUri is required");
  }
}

} // namespace repricer::config
