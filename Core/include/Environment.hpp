#pragma once

#include "Logger.hpp"

#include <span>
#include <string>
#include <unordered_map>

namespace DnD {

class Environment {
public:
  static void set_environment_variable(const std::string &key,
                                       const std::string &value) {
    environment_variables[key] = value;
  }

  static auto contains(const std::string &key) -> bool;
  static void initialize(std::span<const std::string> keys);

private:
  static inline std::unordered_map<std::string, std::string>
      environment_variables{};
};

} // namespace DnD
