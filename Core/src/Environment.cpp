#include "Environment.hpp"

#include <cstdlib>

namespace DnD {

auto Environment::contains(const std::string &key) -> bool {
  return environment_variables.contains(key);
}

void Environment::initialize(std::span<const std::string> keys) {
  for (const auto &key : keys) {
    if (const auto *value = std::getenv(key.c_str())) {
      set_environment_variable(key, value);
      debug("Environment: {}={}", key, value);
    } else {
      debug("Key {} was not found.", key);
    }
  }
}

} // namespace DnD
