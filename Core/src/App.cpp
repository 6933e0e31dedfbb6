#include "App.hpp"

#include "Formatters.hpp"
#include "InterfaceSystem.hpp"
#include "Logger.hpp"

#include <exception>

namespace DnD {

auto AppDeleter::operator()(App *app) const noexcept -> void {
  delete app;
  info("Everything is cleaned up. Goodbye!");
}

App::App(const ApplicationProperties &props) : properties(props) {
  instance = Instance::construct();
  window = Window::construct(*instance, properties.window);
  device = Device::construct(*instance, *window);
}

App::~App() {
  device.reset();
  window.reset();
  instance.reset();
}

auto App::run() -> void {
  static constexpr auto now = [] {
    return std::chrono::high_resolution_clock::now();
  };

  auto interface_system =
      make_scope<InterfaceSystem>(*instance, *device, *window);

  try {
    on_create();

    auto last_time = now();
    const auto total_time = last_time;

    while (!window->should_close()) {
      window->update();
      if (window->size_is_zero()) {
        window->wait_for_events();
        continue;
      }

      fps_average.update();
      if (fps_average.should_print()) {
        fps_average.print();
      }

      const auto current_time = now();
      const auto delta_time_seconds =
          std::chrono::duration<floating>(current_time - last_time).count();
      on_update(delta_time_seconds);

      interface_system->begin_frame();
      on_interface(*interface_system);
      interface_system->end_frame();

      last_time = current_time;
      frame_counter++;
    }

    device->wait_idle();

    info("Total time: {} seconds.",
         std::chrono::duration<floating>(now() - total_time).count());

    on_destroy();
  } catch (const std::exception &exc) {
    error("Main loop exception: {}", exc.what());
    throw;
  }
}

} // namespace DnD
