#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/config/upload_options.hpp"

namespace medsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static medsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static medsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Zero / empty fields keep the UploadOptions defaults.
  static UploadOptions ToUploadOptions(const medsync::runtime::config::RuntimeConfig& config);
};

} // namespace medsync::config
