#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/merge/merge_options.hpp"

namespace eafkit::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static eafkit::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in configuration used when no file is given.
  static eafkit::runtime::config::RuntimeConfig Defaults();
};

merge::MergeOptions ToMergeOptions(const eafkit::runtime::config::RuntimeConfig& config);

} // namespace eafkit::config
