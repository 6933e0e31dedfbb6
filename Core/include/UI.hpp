#pragma once

#include "Math.hpp"
#include "Types.hpp"

#include <fmt/core.h>
#include <imgui.h>
#include <string_view>
#include <type_traits>

namespace DnD::UI {

inline auto to_imvec2(const Math::Vec2 &vector) -> ImVec2 {
  return {vector.x, vector.y};
}

inline auto to_vec2(const ImVec2 &vector) -> Math::Vec2 {
  return {vector.x, vector.y};
}

auto last_item_rect() -> Math::Rect;
auto mouse_position() -> Math::Vec2;

namespace Detail {
auto text_impl(std::string_view) -> void;
auto text_disabled_impl(std::string_view) -> void;
} // namespace Detail

auto begin(std::string_view) -> bool;
auto end() -> void;

auto widget(const std::string_view name, auto &&func) {
  if (UI::begin(name)) {
    if constexpr (std::is_invocable_r_v<void, decltype(func),
                                        const Extent<float> &>) {
      const auto available = ImGui::GetContentRegionAvail();
      func(Extent<float>{available.x, available.y});
    } else {
      func();
    }
  }
  UI::end();
}

template <typename... Args>
auto text(fmt::format_string<Args...> format, Args &&...args) -> void {
  return Detail::text_impl(fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
auto text_disabled(fmt::format_string<Args...> format, Args &&...args)
    -> void {
  return Detail::text_disabled_impl(
      fmt::format(format, std::forward<Args>(args)...));
}

} // namespace DnD::UI
