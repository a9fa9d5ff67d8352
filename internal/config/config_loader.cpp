#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <unordered_set>

#include "internal/parking/fee_calculator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lotgate::config {

namespace cfg = lotgate::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("0800" is a time, not a number)
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
      throw util::ConfigurationError("unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

static cfg::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  cfg::RuntimeConfig config;
  auto               status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ConfigurationError("invalid configuration: " + std::string(status.message()));
  }
  return config;
}

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError("failed to load " + path + ": " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

cfg::RuntimeConfig ConfigLoader::FromYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError("malformed YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

// ------------------------------------------------------------
// Semantic validation
// ------------------------------------------------------------

std::chrono::milliseconds ConfigLoader::DebounceWindow(const cfg::RecognitionConfig& recognition) {
  if (recognition.has_debounce_window()) {
    return util::ToMillis(recognition.debounce_window());
  }
  return 10 * util::ToMillis(recognition.processing_interval(), std::chrono::milliseconds(500));
}

void ConfigLoader::Validate(const cfg::RuntimeConfig& config) {
  const auto& recognition = config.recognition();
  if (recognition.confidence_threshold() < 0.0 || recognition.confidence_threshold() > 1.0) {
    throw util::ConfigurationError("recognition.confidence_threshold must be within [0, 1]");
  }
  if (DebounceWindow(recognition).count() < 0) {
    throw util::ConfigurationError("recognition.debounce_window must not be negative");
  }

  if (config.barriers().empty()) {
    throw util::ConfigurationError("at least one barrier must be configured");
  }

  std::unordered_set<std::string> barrier_ids;
  for (const auto& barrier : config.barriers()) {
    if (barrier.id().empty()) {
      throw util::ConfigurationError("barrier without id");
    }
    if (!barrier_ids.insert(barrier.id()).second) {
      throw util::ConfigurationError("duplicate barrier id '" + barrier.id() + "'");
    }
    if (barrier.has_open_time() && util::ToMillis(barrier.open_time()).count() <= 0) {
      throw util::ConfigurationError("barrier '" + barrier.id() + "' open_time must be positive");
    }
  }

  std::unordered_set<std::string> camera_ids;
  bool                            has_entry = false;
  bool                            has_exit  = false;
  for (const auto& camera : config.cameras()) {
    if (camera.id().empty()) {
      throw util::ConfigurationError("camera without id");
    }
    if (!camera_ids.insert(camera.id()).second) {
      throw util::ConfigurationError("duplicate camera id '" + camera.id() + "'");
    }
    if (!camera.barrier_id().empty() && barrier_ids.count(camera.barrier_id()) == 0) {
      throw util::ConfigurationError("camera '" + camera.id() + "' references unknown barrier '" + camera.barrier_id() + "'");
    }
    has_entry |= camera.role() == cfg::CAMERA_ROLE_ENTRY || camera.role() == cfg::CAMERA_ROLE_BIDIRECTIONAL;
    has_exit |= camera.role() == cfg::CAMERA_ROLE_EXIT || camera.role() == cfg::CAMERA_ROLE_BIDIRECTIONAL;
  }

  const auto& parking_config = config.parking();
  if (parking_config.entry_exit_mode() == cfg::ENTRY_EXIT_MODE_DUAL_CAMERA && (!has_entry || !has_exit)) {
    throw util::ConfigurationError("dual-camera mode needs an entry and an exit camera");
  }
  if (parking_config.has_payment_timeout() && util::ToMillis(parking_config.payment_timeout()).count() < 0) {
    throw util::ConfigurationError("parking.payment_timeout must not be negative");
  }
  if (parking_config.has_paid_exit_window() && util::ToMillis(parking_config.paid_exit_window()).count() < 0) {
    throw util::ConfigurationError("parking.paid_exit_window must not be negative");
  }

  const auto& wiegand = config.forwarder().wiegand();
  if (wiegand.facility_code() > 255) {
    throw util::ConfigurationError("forwarder.wiegand.facility_code must fit in 8 bits");
  }
  if ((wiegand.data0_pin() == 0) != (wiegand.data1_pin() == 0)) {
    throw util::ConfigurationError("forwarder.wiegand needs both data0_pin and data1_pin");
  }
  if (wiegand.data0_pin() != 0 && wiegand.data0_pin() == wiegand.data1_pin()) {
    throw util::ConfigurationError("forwarder.wiegand data lines must use different pins");
  }

  const bool charges = parking_config.operating_mode() != cfg::OPERATING_MODE_ACCESS_CONTROL &&
                       parking_config.operating_mode() != cfg::OPERATING_MODE_FORWARD;
  if (charges && parking_config.payment_required() != cfg::PAYMENT_REQUIRED_NEVER) {
    parking::ValidateFeePolicy(parking_config.fee_policy());
  }
}

} // namespace lotgate::config
