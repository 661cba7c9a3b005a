#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowlog::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google::protobuf::Value, printed as JSON and parsed
  into the generated message; unknown fields are rejected. Quoted scalars
  always stay strings ("5000" is a string, 5000 a number).

  Every loaded config passes Validate(). Errors are std::runtime_error
  (util::InvalidArgument for semantic problems).
*/
class ConfigLoader {
 public:
  static flowlog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static flowlog::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Rejects settings nothing can honour: an empty postgres uri or an
  // unknown log level.
  static void Validate(const flowlog::runtime::config::RuntimeConfig& config);
};

} // namespace flowlog::config
