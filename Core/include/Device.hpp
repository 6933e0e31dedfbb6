#pragma once

#include "Instance.hpp"
#include "Types.hpp"

#include <optional>
#include <vector>
#include <vulkan/vulkan.h>

#include "core/Forward.hpp"

namespace DnD {

/// Logical device with a single queue that supports both graphics and
/// presentation to the window surface. Enough for an ImGui frontend.
class Device {
public:
  virtual ~Device();

  [[nodiscard]] auto get_device() const -> VkDevice { return device; }
  [[nodiscard]] auto get_physical_device() const -> VkPhysicalDevice {
    return physical_device;
  }
  [[nodiscard]] auto get_queue_family() const -> u32 { return queue_family; }
  [[nodiscard]] auto get_queue() const -> VkQueue { return queue; }
  [[nodiscard]] auto get_device_properties() const {
    VkPhysicalDeviceProperties properties;
    vkGetPhysicalDeviceProperties(physical_device, &properties);
    return properties;
  }

  auto wait_idle() const -> void;

  static auto construct(const Instance &, const Window &) -> Scope<Device>;

protected:
  Device(const Instance &, const Window &);

private:
  const Instance &instance;
  VkDevice device{nullptr};
  VkPhysicalDevice physical_device{nullptr};
  VkQueue queue{nullptr};
  u32 queue_family{0};

  static auto enumerate_physical_devices(VkInstance)
      -> std::vector<VkPhysicalDevice>;
  static auto supports_swapchain(VkPhysicalDevice) -> bool;
  static auto find_queue_family(VkPhysicalDevice, VkSurfaceKHR)
      -> std::optional<u32>;
  auto select_physical_device(VkSurfaceKHR) -> void;
  auto create_vulkan_device() -> void;
};

} // namespace DnD
