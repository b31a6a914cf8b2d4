#include <showlink/exit_codes.h>

#include <showlink/models.h>

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace showlink {

int ExitCodeForException(const std::exception &error) {
  if (dynamic_cast<const std::invalid_argument *>(&error) != nullptr ||
      dynamic_cast<const YAML::Exception *>(&error) != nullptr) {
    return kExitUsageError;
  }
  if (dynamic_cast<const ConfigurationError *>(&error) != nullptr) {
    return kExitConfigurationError;
  }
  return kExitRuntimeError;
}

} // namespace showlink
