#include "InterfaceSystem.hpp"

#include "Config.hpp"
#include "Device.hpp"
#include "Ensure.hpp"
#include "Instance.hpp"
#include "Logger.hpp"
#include "Verify.hpp"
#include "Window.hpp"

#include <GLFW/glfw3.h>
#include <array>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>

namespace DnD {

namespace {

auto check_vk_result(VkResult result) -> void {
  verify(result, "ImGui_ImplVulkan", "Vulkan backend call failed");
}

} // namespace

InterfaceSystem::InterfaceSystem(const Instance &inst, const Device &dev,
                                 Window &win)
    : instance(&inst), device(&dev), window(&win) {
  create_descriptor_pool();
  create_swapchain();

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();

  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  io.IniFilename = nullptr;

  ImGui::StyleColorsDark();
  ImGuiStyle &style = ImGui::GetStyle();
  style.FrameRounding = 3.0F;
  style.Colors[ImGuiCol_WindowBg] =
      ImVec4(0.15F, 0.15F, 0.15F, style.Colors[ImGuiCol_WindowBg].w);

  ImGui_ImplGlfw_InitForVulkan(window->get_native(), true);

  ImGui_ImplVulkan_InitInfo init_info = {};
  init_info.Instance = instance->get_instance();
  init_info.PhysicalDevice = device->get_physical_device();
  init_info.Device = device->get_device();
  init_info.QueueFamily = device->get_queue_family();
  init_info.Queue = device->get_queue();
  init_info.DescriptorPool = pool;
  init_info.Subpass = 0;
  init_info.MinImageCount = Config::min_image_count;
  init_info.ImageCount = main_window.ImageCount;
  init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
  init_info.CheckVkResultFn = check_vk_result;
  ImGui_ImplVulkan_Init(&init_info, main_window.RenderPass);

  info("Interface initialised, {} swapchain images",
       main_window.ImageCount);
}

InterfaceSystem::~InterfaceSystem() {
  vkDeviceWaitIdle(device->get_device());

  ImGui_ImplVulkan_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  // The window owns the surface.
  main_window.Surface = VK_NULL_HANDLE;
  ImGui_ImplVulkanH_DestroyWindow(instance->get_instance(),
                                  device->get_device(), &main_window,
                                  nullptr);
  vkDestroyDescriptorPool(device->get_device(), pool, nullptr);
  info("Destroyed InterfaceSystem!");
}

auto InterfaceSystem::create_descriptor_pool() -> void {
  const std::array pool_sizes{
      VkDescriptorPoolSize{VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1},
  };

  VkDescriptorPoolCreateInfo pool_info{
      .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
      .flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT,
      .maxSets = 1,
      .poolSizeCount = static_cast<u32>(pool_sizes.size()),
      .pPoolSizes = pool_sizes.data(),
  };

  verify(
      vkCreateDescriptorPool(device->get_device(), &pool_info, nullptr, &pool),
      "vkCreateDescriptorPool", "Failed to create descriptor pool");
}

auto InterfaceSystem::create_swapchain() -> void {
  main_window.Surface = window->get_surface();

  static constexpr std::array requested_formats{
      VK_FORMAT_B8G8R8A8_UNORM,
      VK_FORMAT_R8G8B8A8_UNORM,
      VK_FORMAT_B8G8R8_UNORM,
      VK_FORMAT_R8G8B8_UNORM,
  };
  main_window.SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(
      device->get_physical_device(), main_window.Surface,
      requested_formats.data(), static_cast<i32>(requested_formats.size()),
      VK_COLORSPACE_SRGB_NONLINEAR_KHR);

  const std::array present_modes{
      window->get_properties().vsync ? VK_PRESENT_MODE_FIFO_KHR
                                     : VK_PRESENT_MODE_MAILBOX_KHR,
      VK_PRESENT_MODE_FIFO_KHR,
  };
  main_window.PresentMode = ImGui_ImplVulkanH_SelectPresentMode(
      device->get_physical_device(), main_window.Surface, present_modes.data(),
      static_cast<i32>(present_modes.size()));

  const auto &&[width, height] = window->get_framebuffer_size().as<i32>();
  ImGui_ImplVulkanH_CreateOrResizeWindow(
      instance->get_instance(), device->get_physical_device(),
      device->get_device(), &main_window, device->get_queue_family(), nullptr,
      width, height, Config::min_image_count);
  ensure(main_window.ImageCount >= Config::min_image_count,
         "Swapchain has {} images, expected at least {}",
         main_window.ImageCount, Config::min_image_count);
  debug("Created swapchain {}x{}", width, height);
}

auto InterfaceSystem::rebuild_swapchain() -> void {
  const auto extent = window->get_framebuffer_size();
  if (!extent.valid()) {
    return;
  }

  const auto &&[width, height] = extent.as<i32>();
  ImGui_ImplVulkan_SetMinImageCount(Config::min_image_count);
  ImGui_ImplVulkanH_CreateOrResizeWindow(
      instance->get_instance(), device->get_physical_device(),
      device->get_device(), &main_window, device->get_queue_family(), nullptr,
      width, height, Config::min_image_count);
  main_window.FrameIndex = 0;
  swapchain_rebuild = false;
  window->reset_resize_status();
  debug("Rebuilt swapchain {}x{}", width, height);
}

auto InterfaceSystem::begin_frame() -> void {
  if (swapchain_rebuild || window->was_resized()) {
    rebuild_swapchain();
  }

  ImGui_ImplVulkan_NewFrame();
  ImGui_ImplGlfw_NewFrame();
  ImGui::NewFrame();
}

auto InterfaceSystem::end_frame() -> void {
  ImGui::Render();
  auto *draw_data = ImGui::GetDrawData();
  const bool minimised =
      draw_data->DisplaySize.x <= 0.0F || draw_data->DisplaySize.y <= 0.0F;
  if (minimised) {
    return;
  }

  main_window.ClearValue.color = VkClearColorValue{{0.1F, 0.1F, 0.1F, 1.0F}};
  frame_render(draw_data);
  frame_present();
}

auto InterfaceSystem::frame_render(ImDrawData *draw_data) -> void {
  auto vk_device = device->get_device();

  const auto &semaphores =
      main_window.FrameSemaphores[main_window.SemaphoreIndex];
  const auto result = vkAcquireNextImageKHR(
      vk_device, main_window.Swapchain, UINT64_MAX,
      semaphores.ImageAcquiredSemaphore, VK_NULL_HANDLE,
      &main_window.FrameIndex);
  if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR) {
    swapchain_rebuild = true;
    return;
  }
  verify(result, "vkAcquireNextImageKHR", "Failed to acquire swapchain image");

  auto &frame = main_window.Frames[main_window.FrameIndex];
  verify(vkWaitForFences(vk_device, 1, &frame.Fence, VK_TRUE, UINT64_MAX),
         "vkWaitForFences", "Failed waiting for frame {}",
         main_window.FrameIndex);
  verify(vkResetFences(vk_device, 1, &frame.Fence), "vkResetFences",
         "Failed to reset fence");

  verify(vkResetCommandPool(vk_device, frame.CommandPool, 0),
         "vkResetCommandPool", "Failed to reset command pool");
  VkCommandBufferBeginInfo begin_info{
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
      .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
  };
  verify(vkBeginCommandBuffer(frame.CommandBuffer, &begin_info),
         "vkBeginCommandBuffer", "Failed to begin command buffer");

  VkRenderPassBeginInfo render_pass_info{
      .sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO,
      .renderPass = main_window.RenderPass,
      .framebuffer = frame.Framebuffer,
      .renderArea = {.offset = {0, 0},
                     .extent = {static_cast<u32>(main_window.Width),
                                static_cast<u32>(main_window.Height)}},
      .clearValueCount = 1,
      .pClearValues = &main_window.ClearValue,
  };
  vkCmdBeginRenderPass(frame.CommandBuffer, &render_pass_info,
                       VK_SUBPASS_CONTENTS_INLINE);
  ImGui_ImplVulkan_RenderDrawData(draw_data, frame.CommandBuffer);
  vkCmdEndRenderPass(frame.CommandBuffer);

  verify(vkEndCommandBuffer(frame.CommandBuffer), "vkEndCommandBuffer",
         "Failed to end command buffer");

  const VkPipelineStageFlags wait_stage =
      VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
  VkSubmitInfo submit_info{
      .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO,
      .waitSemaphoreCount = 1,
      .pWaitSemaphores = &semaphores.ImageAcquiredSemaphore,
      .pWaitDstStageMask = &wait_stage,
      .commandBufferCount = 1,
      .pCommandBuffers = &frame.CommandBuffer,
      .signalSemaphoreCount = 1,
      .pSignalSemaphores = &semaphores.RenderCompleteSemaphore,
  };
  verify(vkQueueSubmit(device->get_queue(), 1, &submit_info, frame.Fence),
         "vkQueueSubmit", "Failed to submit interface frame");
}

auto InterfaceSystem::frame_present() -> void {
  if (swapchain_rebuild) {
    return;
  }

  const auto &semaphores =
      main_window.FrameSemaphores[main_window.SemaphoreIndex];
  VkPresentInfoKHR present_info{
      .sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR,
      .waitSemaphoreCount = 1,
      .pWaitSemaphores = &semaphores.RenderCompleteSemaphore,
      .swapchainCount = 1,
      .pSwapchains = &main_window.Swapchain,
      .pImageIndices = &main_window.FrameIndex,
  };
  const auto result = vkQueuePresentKHR(device->get_queue(), &present_info);
  if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR) {
    swapchain_rebuild = true;
    return;
  }
  verify(result, "vkQueuePresentKHR", "Failed to present");

  main_window.SemaphoreIndex =
      (main_window.SemaphoreIndex + 1) % main_window.ImageCount;
}

} // namespace DnD
