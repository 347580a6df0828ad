#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace eafkit::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw util::InvalidArgument("unsupported YAML node in configuration");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

eafkit::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("failed to load YAML config: " + std::string(e.what()));
  }

  // An empty file is a valid, all-default configuration.
  if (yaml.IsNull()) {
    return Defaults();
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  eafkit::runtime::config::RuntimeConfig parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);

  if (!status.ok()) {
    throw util::InvalidArgument("invalid configuration: " + std::string(status.message()));
  }

  // Keys present in the file override the defaults.
  eafkit::runtime::config::RuntimeConfig config = Defaults();
  config.MergeFrom(parsed);
  return config;
}

eafkit::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  eafkit::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_engine()->set_merge_overlap_strategy(eafkit::runtime::config::OVERLAP_STRATEGY_FAIL);
  config.mutable_engine()->set_allow_negative_shift(false);
  config.mutable_engine()->set_validate_overlaps_on_load(true);
  return config;
}

merge::MergeOptions ToMergeOptions(const eafkit::runtime::config::RuntimeConfig& config) {
  merge::MergeOptions options;
  switch (config.engine().merge_overlap_strategy()) {
    case eafkit::runtime::config::OVERLAP_STRATEGY_FAIL:
      options.overlap_strategy = merge::OverlapStrategy::kFail;
      break;
    case eafkit::runtime::config::OVERLAP_STRATEGY_JOIN:
      options.overlap_strategy = merge::OverlapStrategy::kJoin;
      break;
    case eafkit::runtime::config::OVERLAP_STRATEGY_DISCARD_FIRST:
      options.overlap_strategy = merge::OverlapStrategy::kDiscardFirst;
      break;
    case eafkit::runtime::config::OVERLAP_STRATEGY_DISCARD_LAST:
      options.overlap_strategy = merge::OverlapStrategy::kDiscardLast;
      break;
    case eafkit::runtime::config::OVERLAP_STRATEGY_PRIORITIZE_FIRST:
      options.overlap_strategy = merge::OverlapStrategy::kPrioritizeFirst;
      break;
    case eafkit::runtime::config::OVERLAP_STRATEGY_PRIORITIZE_LAST:
      options.overlap_strategy = merge::OverlapStrategy::kPrioritizeLast;
      break;
    default:
      throw util::InvalidArgument("merge_overlap_strategy " + std::to_string(config.engine().merge_overlap_strategy()));
  }
  return options;
}

} // namespace eafkit::config
