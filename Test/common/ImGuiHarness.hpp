#pragma once

#include "Math.hpp"
#include "Types.hpp"

#include <imgui.h>
#include <utility>

namespace DnD::Testing {

/// An ImGui context without a platform or renderer backend. Every frame
/// draws into one window covering the whole display, and input is queued
/// through the regular io event API.
class ImGuiHarness {
public:
  ImGuiHarness() : context(ImGui::CreateContext()) {
    auto &io = ImGui::GetIO();
    io.DisplaySize = {800.0F, 600.0F};
    io.DeltaTime = 1.0F / 60.0F;
    io.IniFilename = nullptr;
    io.LogFilename = nullptr;
    io.ConfigInputTrickleEventQueue = false;

    unsigned char *pixels{nullptr};
    i32 width{0};
    i32 height{0};
    io.Fonts->AddFontDefault();
    io.Fonts->GetTexDataAsRGBA32(&pixels, &width, &height);
  }

  ~ImGuiHarness() { ImGui::DestroyContext(context); }

  ImGuiHarness(const ImGuiHarness &) = delete;
  auto operator=(const ImGuiHarness &) -> ImGuiHarness & = delete;

  template <class Func> auto frame(Func &&contents) -> void {
    ImGui::NewFrame();
    ImGui::SetNextWindowPos({0.0F, 0.0F});
    ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
    ImGui::Begin("Harness", nullptr, window_flags);
    std::forward<Func>(contents)();
    ImGui::End();
    ImGui::Render();
  }

  /// Runs a few empty frames so that the harness window can be hovered.
  template <class Func> auto warm_up(Func &&contents, u32 count = 3) -> void {
    for (u32 i = 0; i < count; ++i) {
      frame(contents);
    }
  }

  auto move_mouse(const Math::Vec2 &position) -> void {
    ImGui::GetIO().AddMousePosEvent(position.x, position.y);
  }
  auto press_mouse() -> void {
    ImGui::GetIO().AddMouseButtonEvent(ImGuiMouseButton_Left, true);
  }
  auto release_mouse() -> void {
    ImGui::GetIO().AddMouseButtonEvent(ImGuiMouseButton_Left, false);
  }
  auto key(ImGuiKey key, bool down) -> void {
    ImGui::GetIO().AddKeyEvent(key, down);
  }
  auto focus(bool focused) -> void { ImGui::GetIO().AddFocusEvent(focused); }

  /// A point inside the "::" handle drawn at the left edge of `row`.
  static auto handle_of(const Math::Rect &row) -> Math::Vec2 {
    return {row.min.x + 3.0F, row.center().y};
  }

  /// A point just below the midpoint of `row`.
  static auto past_midpoint(const Math::Rect &row) -> Math::Vec2 {
    return {row.min.x + 3.0F, row.center().y + 1.0F};
  }

private:
  static constexpr ImGuiWindowFlags window_flags =
      ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
      ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;

  ImGuiContext *context{nullptr};
};

} // namespace DnD::Testing
