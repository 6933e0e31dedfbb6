#include "Device.hpp"

#include "Exception.hpp"
#include "Logger.hpp"
#include "Verify.hpp"
#include "Window.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <string_view>
#include <tuple>
#include <utility>

namespace DnD {

namespace {

constexpr std::array device_extensions{VK_KHR_SWAPCHAIN_EXTENSION_NAME};

} // namespace

Device::Device(const Instance &inst, const Window &window) : instance(inst) {
  select_physical_device(window.get_surface());
  create_vulkan_device();
}

Device::~Device() {
  wait_idle();
  vkDestroyDevice(device, nullptr);
  info("Destroyed Device!");
}

auto Device::construct(const Instance &instance, const Window &window)
    -> Scope<Device> {
  return Scope<Device>{new Device(instance, window)};
}

auto Device::wait_idle() const -> void {
  verify(vkDeviceWaitIdle(device), "vkDeviceWaitIdle",
         "Failed waiting for device");
}

auto Device::enumerate_physical_devices(VkInstance inst)
    -> std::vector<VkPhysicalDevice> {
  u32 device_count = 0;
  verify(vkEnumeratePhysicalDevices(inst, &device_count, nullptr),
         "vkEnumeratePhysicalDevices", "Could not count physical devices");
  std::vector<VkPhysicalDevice> devices(device_count);
  verify(vkEnumeratePhysicalDevices(inst, &device_count, devices.data()),
         "vkEnumeratePhysicalDevices", "Could not list physical devices");
  return devices;
}

auto Device::supports_swapchain(VkPhysicalDevice dev) -> bool {
  u32 extension_count = 0;
  vkEnumerateDeviceExtensionProperties(dev, nullptr, &extension_count, nullptr);
  std::vector<VkExtensionProperties> available(extension_count);
  vkEnumerateDeviceExtensionProperties(dev, nullptr, &extension_count,
                                       available.data());

  return std::ranges::all_of(device_extensions, [&](std::string_view required) {
    return std::ranges::any_of(available, [&](const auto &extension) {
      return required == extension.extensionName;
    });
  });
}

auto Device::find_queue_family(VkPhysicalDevice dev, VkSurfaceKHR surface)
    -> std::optional<u32> {
  u32 family_count = 0;
  vkGetPhysicalDeviceQueueFamilyProperties(dev, &family_count, nullptr);
  std::vector<VkQueueFamilyProperties> families(family_count);
  vkGetPhysicalDeviceQueueFamilyProperties(dev, &family_count,
                                           families.data());

  for (u32 i = 0; i < family_count; ++i) {
    if ((families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) == 0) {
      continue;
    }
    VkBool32 can_present = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(dev, i, surface, &can_present);
    if (can_present == VK_TRUE) {
      return i;
    }
  }
  return std::nullopt;
}

auto Device::select_physical_device(VkSurfaceKHR surface) -> void {
  const auto devices = enumerate_physical_devices(instance.get_instance());

  std::optional<std::pair<VkPhysicalDevice, u32>> fallback{};
  for (const auto &dev : devices) {
    VkPhysicalDeviceProperties properties;
    vkGetPhysicalDeviceProperties(dev, &properties);

    if (!supports_swapchain(dev)) {
      debug("Skipping {}: no swapchain support", properties.deviceName);
      continue;
    }
    const auto family = find_queue_family(dev, surface);
    if (!family) {
      debug("Skipping {}: no queue can present to the surface",
            properties.deviceName);
      continue;
    }

    // Prefer devices with discrete GPUs
    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
      fallback = std::make_pair(dev, *family);
      break;
    }
    if (!fallback) {
      fallback = std::make_pair(dev, *family);
    }
  }

  if (!fallback) {
    throw NotFoundException("No Vulkan device can present to the window");
  }

  std::tie(physical_device, queue_family) = *fallback;
  info("Selected device: {}", get_device_properties().deviceName);
}

auto Device::create_vulkan_device() -> void {
  static constexpr auto priority = 1.0F;
  VkDeviceQueueCreateInfo queue_info{
      .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
      .queueFamilyIndex = queue_family,
      .queueCount = 1,
      .pQueuePriorities = &priority,
  };

  VkDeviceCreateInfo create_info{
      .sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
      .pNext = nullptr,
      .queueCreateInfoCount = 1,
      .pQueueCreateInfos = &queue_info,
      .enabledExtensionCount = static_cast<u32>(device_extensions.size()),
      .ppEnabledExtensionNames = device_extensions.data(),
  };

  verify(vkCreateDevice(physical_device, &create_info, nullptr, &device),
         "vkCreateDevice", "Failed to create Vulkan device");
  vkGetDeviceQueue(device, queue_family, 0, &queue);

  info("Created Vulkan device, graphics queue family index {}, queue {}",
       queue_family, fmt::ptr(queue));
}

} // namespace DnD
