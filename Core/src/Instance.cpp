#include "Instance.hpp"

#include "Environment.hpp"
#include "Exception.hpp"
#include "Logger.hpp"
#include "Verify.hpp"

#include <GLFW/glfw3.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace DnD {

namespace {

auto create_debug_utils_messenger_ext(
    VkInstance instance, const VkDebugUtilsMessengerCreateInfoEXT *create_info,
    VkDebugUtilsMessengerEXT *messenger) -> VkResult {
  auto func = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
      vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT"));
  if (func == nullptr) {
    return VK_ERROR_EXTENSION_NOT_PRESENT;
  }
  return func(instance, create_info, nullptr, messenger);
}

auto destroy_debug_utils_messenger_ext(VkInstance instance,
                                       VkDebugUtilsMessengerEXT messenger)
    -> void {
  auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
      vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));
  if (func != nullptr) {
    func(instance, messenger, nullptr);
  }
}

VKAPI_ATTR auto VKAPI_CALL
debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT message_severity,
               VkDebugUtilsMessageTypeFlagsEXT,
               const VkDebugUtilsMessengerCallbackDataEXT *callback_data,
               void *) -> VkBool32 {
  if (message_severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
    error("Validation layer: {}", callback_data->pMessage);
  } else if (message_severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
    info("Validation layer: {}", callback_data->pMessage);
  } else {
    debug("Validation layer: {}", callback_data->pMessage);
  }
  return VK_FALSE;
}

auto debug_messenger_create_info() -> VkDebugUtilsMessengerCreateInfoEXT {
  return VkDebugUtilsMessengerCreateInfoEXT{
      .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT,
      .messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT,
      .messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT,
      .pfnUserCallback = debug_callback,
  };
}

} // namespace

Instance::Instance() { construct_vulkan_instance(); }

Instance::~Instance() {
  if (debug_messenger != nullptr) {
    destroy_debug_utils_messenger_ext(instance, debug_messenger);
    info("Destroyed Debug Messenger!");
  }

  vkDestroyInstance(instance, nullptr);
  info("Destroyed Instance!");
}

auto Instance::construct() -> Scope<Instance> {
  return Scope<Instance>{new Instance{}};
}

auto Instance::construct_vulkan_instance() -> void {
  VkApplicationInfo application_info{
      .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
      .pNext = nullptr,
      .pApplicationName = "Drag and drop",
      .applicationVersion = VK_MAKE_VERSION(1, 0, 0),
      .pEngineName = "No Engine",
      .engineVersion = VK_MAKE_VERSION(1, 0, 0),
      .apiVersion = VK_API_VERSION_1_2,
  };

  std::vector<const char *> enabled_layers = {};
  enable_validation_layers = Environment::contains("ENABLE_VALIDATION_LAYERS");
  if (enable_validation_layers) {
    enabled_layers.push_back("VK_LAYER_KHRONOS_validation");
  }

  std::vector<const char *> enabled_extensions = {};
#ifdef DND_DEBUG
  enabled_extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
#else
  if (enable_validation_layers) {
    enabled_extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
  }
#endif

  if (glfwInit() == GLFW_FALSE) {
    throw WindowException("Failed to initialize GLFW");
  }

  u32 count{0};
  const char **glfw_extensions = glfwGetRequiredInstanceExtensions(&count);
  if (glfw_extensions == nullptr) {
    throw WindowException("GLFW found no Vulkan surface extensions");
  }
  for (u32 i = 0; i < count; ++i) {
    enabled_extensions.push_back(glfw_extensions[i]);
  }

  VkInstanceCreateInfo create_info{
      .sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
      .pNext = nullptr,
      .pApplicationInfo = &application_info,
      .enabledLayerCount = static_cast<u32>(enabled_layers.size()),
      .ppEnabledLayerNames = enabled_layers.data(),
      .enabledExtensionCount = static_cast<u32>(enabled_extensions.size()),
      .ppEnabledExtensionNames = enabled_extensions.data(),
  };

  auto debug_create_info = debug_messenger_create_info();
  if (enable_validation_layers) {
    create_info.pNext = &debug_create_info;
  }

  verify(vkCreateInstance(&create_info, nullptr, &instance), "vkCreateInstance",
         "Failed to create Vulkan instance");

  info("Created Vulkan instance. Enabled layers (count={}): [{}], enabled "
       "extensions (count={}): [{}]",
       enabled_layers.size(), fmt::join(enabled_layers, ", "),
       enabled_extensions.size(), fmt::join(enabled_extensions, ", "));

  setup_debug_messenger();
}

auto Instance::setup_debug_messenger() -> void {
  if (!enable_validation_layers) {
    return;
  }

  const auto create_info = debug_messenger_create_info();
  verify(create_debug_utils_messenger_ext(instance, &create_info,
                                          &debug_messenger),
         "create_debug_utils_messenger_ext",
         "Failed to set up debug messenger!");
}

} // namespace DnD
