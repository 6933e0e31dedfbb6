#pragma once

#include "Config.hpp"
#include "Types.hpp"

#include <string>
#include <vulkan/vulkan.h>

#include "core/Forward.hpp"

extern "C" {
struct GLFWwindow;
}

namespace DnD {

struct WindowProperties {
  Extent<u32> extent{Config::window_width, Config::window_height};
  std::string title{"Drag and drop"};
  bool vsync{true};
};

class Window {
public:
  virtual ~Window();

  auto update() -> void;
  auto wait_for_events() -> void;

  [[nodiscard]] auto get_native() const -> const GLFWwindow *;
  [[nodiscard]] auto get_native() -> GLFWwindow *;
  [[nodiscard]] auto get_surface() const -> VkSurfaceKHR;
  [[nodiscard]] auto should_close() const -> bool;

  [[nodiscard]] auto was_resized() const -> bool;
  auto reset_resize_status() -> void;

  [[nodiscard]] auto size_is_zero() const -> bool;
  [[nodiscard]] auto get_extent() const -> Extent<u32>;
  [[nodiscard]] auto get_framebuffer_size() const -> Extent<u32>;
  [[nodiscard]] auto get_properties() const -> const WindowProperties &;

  static auto construct(const Instance &, const WindowProperties &)
      -> Scope<Window>;

  auto close() -> void;

protected:
  Window(const Instance &, const WindowProperties &);

private:
  const Instance *instance{};

  WindowProperties properties;
  GLFWwindow *window{nullptr};
  VkSurfaceKHR surface{};
  bool resized{false};
};

} // namespace DnD
