#include "ClientApp.hpp"

#include "Logger.hpp"
#include "UI.hpp"

#include <imgui.h>

#include "widgets/include/ReorderWidget.hpp"

ClientApp::ClientApp(const ApplicationProperties &props) : App(props) {
  widgets.emplace_back(make_scope<ReorderWidget>());
}

void ClientApp::on_create() {
  for (const auto &widget : widgets) {
    widget->on_create();
  }
}

void ClientApp::on_destroy() {
  for (const auto &widget : widgets) {
    widget->on_destroy();
  }
  widgets.clear();
}

void ClientApp::on_update(floating ts) {
  for (const auto &widget : widgets) {
    widget->on_update(ts);
  }
}

void ClientApp::on_interface(InterfaceSystem &interface_system) {
  for (const auto &widget : widgets) {
    widget->on_interface(interface_system);
  }
  statistics();
}

auto ClientApp::statistics() -> void {
  ImGui::SetNextWindowPos({10.0F, 10.0F}, ImGuiCond_FirstUseEver);
  UI::widget("Statistics", [this]() {
    const auto &&[frame_time, fps] = get_timer().get_statistics();
    UI::text("Frame time: {:.3f} ms", frame_time);
    UI::text("FPS: {:.0f}", fps);
    UI::text("Frames: {}", get_frame_counter());
  });
}
