#include "Window.hpp"

#include "Exception.hpp"
#include "Instance.hpp"
#include "Logger.hpp"
#include "Verify.hpp"

#include <GLFW/glfw3.h>

namespace DnD {

Window::Window(const Instance &inst, const WindowProperties &props)
    : instance(&inst), properties(props) {
  if (glfwInit() == GLFW_FALSE) {
    throw WindowException("Failed to initialize GLFW");
  }

  if (glfwVulkanSupported() == GLFW_FALSE) {
    glfwTerminate();
    throw WindowException("Vulkan not supported");
  }

  glfwSetErrorCallback(+[](i32 code, const char *description) {
    error("GLFW error {}: {}", code, description);
  });

  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
  auto &&[width, height] = properties.extent.as<i32>();
  window = glfwCreateWindow(width, height, properties.title.c_str(), nullptr,
                            nullptr);
  if (window == nullptr) {
    glfwTerminate();
    throw WindowException("Failed to create window");
  }

  const auto surface_result = glfwCreateWindowSurface(
      instance->get_instance(), window, nullptr, &surface);
  if (surface_result != VK_SUCCESS) {
    glfwDestroyWindow(window);
    glfwTerminate();
  }
  verify(surface_result, "glfwCreateWindowSurface",
         "Failed to create window surface");

  glfwSetWindowUserPointer(window, this);
  glfwSetFramebufferSizeCallback(
      window, +[](GLFWwindow *win, i32 w, i32 h) {
        auto &self = *static_cast<Window *>(glfwGetWindowUserPointer(win));
        self.properties.extent = {
            static_cast<u32>(w),
            static_cast<u32>(h),
        };
        self.resized = true;
        trace("Framebuffer resized to {}x{}", w, h);
      });

  info("Created window '{}' ({}x{})", properties.title, width, height);
}

Window::~Window() {
  vkDestroySurfaceKHR(instance->get_instance(), surface, nullptr);
  glfwDestroyWindow(window);
  glfwTerminate();
  info("Destroyed Window!");
}

auto Window::construct(const Instance &instance,
                       const WindowProperties &properties) -> Scope<Window> {
  return Scope<Window>{new Window{instance, properties}};
}

auto Window::close() -> void { glfwSetWindowShouldClose(window, GLFW_TRUE); }

auto Window::should_close() const -> bool {
  return glfwWindowShouldClose(window) != GLFW_FALSE;
}

auto Window::update() -> void { glfwPollEvents(); }

auto Window::wait_for_events() -> void { glfwWaitEvents(); }

auto Window::get_native() const -> const GLFWwindow * { return window; }
auto Window::get_native() -> GLFWwindow * { return window; }
auto Window::get_surface() const -> VkSurfaceKHR { return surface; }

auto Window::was_resized() const -> bool {
  return resized || size_is_zero() ||
         glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0;
}

auto Window::reset_resize_status() -> void { resized = false; }

auto Window::size_is_zero() const -> bool {
  auto &&[width, height] = get_framebuffer_size();
  return width == 0 || height == 0;
}

auto Window::get_extent() const -> Extent<u32> { return properties.extent; }

auto Window::get_framebuffer_size() const -> Extent<u32> {
  i32 w{};
  i32 h{};
  glfwGetFramebufferSize(window, &w, &h);
  return {
      static_cast<u32>(w),
      static_cast<u32>(h),
  };
}

auto Window::get_properties() const -> const WindowProperties & {
  return properties;
}

} // namespace DnD
