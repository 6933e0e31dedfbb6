#pragma once

#include "Device.hpp"
#include "FPSAverage.hpp"
#include "Instance.hpp"
#include "Logger.hpp"
#include "Types.hpp"
#include "Window.hpp"

namespace DnD {

class InterfaceSystem;
class App;
struct AppDeleter {
  auto operator()(App *app) const noexcept -> void;
};

struct ApplicationProperties {
  WindowProperties window{};
};

class App {
public:
  auto run() -> void;
  virtual ~App();

protected:
  virtual auto on_update(floating ts) -> void = 0;
  virtual auto on_interface(InterfaceSystem &) -> void = 0;
  virtual auto on_create() -> void = 0;
  virtual auto on_destroy() -> void = 0;

  explicit App(const ApplicationProperties &);

  [[nodiscard]] auto get_window() const -> const Scope<Window> & {
    return window;
  }
  [[nodiscard]] auto get_frame_counter() const -> u64 { return frame_counter; }
  [[nodiscard]] auto get_timer() const -> const auto & { return fps_average; }

private:
  ApplicationProperties properties{};

  Scope<Instance> instance;
  Scope<Window> window;
  Scope<Device> device;

  FPSAverage<144> fps_average{};
  u64 frame_counter{0};
};

auto extern make_application(const ApplicationProperties &)
    -> Scope<App, AppDeleter>;

} // namespace DnD
