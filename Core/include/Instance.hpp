#pragma once

#include "Types.hpp"

#include <vulkan/vulkan.h>

namespace DnD {

class Instance {
public:
  virtual ~Instance();

  [[nodiscard]] auto get_instance() const -> VkInstance { return instance; }
  [[nodiscard]] auto validation_enabled() const -> bool {
    return enable_validation_layers;
  }

  static auto construct() -> Scope<Instance>;

protected:
  Instance();

private:
  VkInstance instance{nullptr};
  VkDebugUtilsMessengerEXT debug_messenger{nullptr};
  bool enable_validation_layers{false};

  auto construct_vulkan_instance() -> void;
  auto setup_debug_messenger() -> void;
};

} // namespace DnD
