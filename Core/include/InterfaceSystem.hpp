#pragma once

#include "Types.hpp"

#include <imgui_impl_vulkan.h>
#include <vulkan/vulkan.h>

#include "core/Forward.hpp"

namespace DnD {

/// Owns the ImGui context, its GLFW and Vulkan backends and the swapchain the
/// interface is presented to.
class InterfaceSystem {
public:
  InterfaceSystem(const Instance &, const Device &, Window &);
  ~InterfaceSystem();

  InterfaceSystem(const InterfaceSystem &) = delete;
  auto operator=(const InterfaceSystem &) -> InterfaceSystem & = delete;

  /// Starts an ImGui frame. Rebuilds the swapchain first if the window was
  /// resized or the previous present reported it out of date.
  auto begin_frame() -> void;
  /// Renders the frame and presents it. Skipped while minimised.
  auto end_frame() -> void;

private:
  const Instance *instance{nullptr};
  const Device *device{nullptr};
  Window *window{nullptr};

  VkDescriptorPool pool{nullptr};
  ImGui_ImplVulkanH_Window main_window{};
  bool swapchain_rebuild{false};

  auto create_descriptor_pool() -> void;
  auto create_swapchain() -> void;
  auto rebuild_swapchain() -> void;
  auto frame_render(ImDrawData *) -> void;
  auto frame_present() -> void;
};

} // namespace DnD
