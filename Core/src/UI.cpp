#include "UI.hpp"

#include <string>

namespace DnD::UI {

auto last_item_rect() -> Math::Rect {
  return {to_vec2(ImGui::GetItemRectMin()), to_vec2(ImGui::GetItemRectMax())};
}

auto mouse_position() -> Math::Vec2 { return to_vec2(ImGui::GetMousePos()); }

auto begin(const std::string_view name) -> bool {
  const std::string terminated{name};
  return ImGui::Begin(terminated.c_str());
}

auto end() -> void { ImGui::End(); }

namespace Detail {

auto text_impl(std::string_view text) -> void {
  ImGui::TextUnformatted(text.data(), text.data() + text.size());
}

auto text_disabled_impl(std::string_view text) -> void {
  ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
  ImGui::TextUnformatted(text.data(), text.data() + text.size());
  ImGui::PopStyleColor();
}

} // namespace Detail

} // namespace DnD::UI
