#include "dnd/DragDropList.hpp"

#include "Containers.hpp"
#include "Formatters.hpp"
#include "Logger.hpp"
#include "UI.hpp"

#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <imgui_internal.h>
#include <iterator>
#include <numeric>

namespace DnD {

namespace {

constexpr ImGuiWindowFlags preview_window_flags =
    ImGuiWindowFlags_Tooltip | ImGuiWindowFlags_NoInputs |
    ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
    ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoNav |
    ImGuiWindowFlags_NoFocusOnAppearing;

} // namespace

auto DragHandle::interact() -> void {
  if (handle_mode != HandleMode::Interactive) {
    return;
  }

  const ImRect bounding_box{ImGui::GetItemRectMin(), ImGui::GetItemRectMax()};
  if (!ImGui::ItemAdd(bounding_box, handle_id)) {
    return;
  }

  bool hovered = false;
  bool held = false;
  const bool pressed =
      ImGui::ButtonBehavior(bounding_box, handle_id, &hovered, &held,
                            ImGuiButtonFlags_PressedOnClick);
  if (hovered || held) {
    ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
  }
  if (pressed) {
    owner->on_handle_pressed(handle_id, item_index);
  }
}

auto DragDropList::push_item_id(ItemId id) -> void {
  ImGui::PushID(reinterpret_cast<const void *>(static_cast<std::uintptr_t>(id)));
}

auto DragDropList::cancel() -> void {
  session.cancel();
  release_active_id();
}

auto DragDropList::release_active_id() -> void {
  if (dragged_handle != 0 && ImGui::GetCurrentContext() != nullptr &&
      ImGui::GetActiveID() == dragged_handle) {
    ImGui::ClearActiveID();
  }
  dragged_handle = 0;
}

auto DragDropList::begin_layout() -> void {
  list_origin = UI::to_vec2(ImGui::GetCursorScreenPos());
  available_width = ImGui::GetContentRegionAvail().x;

  if (!splitter) {
    splitter = make_scope<ImDrawListSplitter>();
  }
  auto *draw_list = ImGui::GetWindowDrawList();
  splitter->Split(draw_list, 2);
  splitter->SetCurrentChannel(draw_list, 1);

  ImGui::SetCursorScreenPos(
      UI::to_imvec2(list_origin + Math::Vec2{options.margin}));
  ImGui::BeginGroup();
}

auto DragDropList::end_layout() -> Math::Rect {
  ImGui::EndGroup();
  const auto contents = UI::last_item_rect();

  Math::Rect outer{list_origin, contents.max + Math::Vec2{options.margin}};
  outer.max.x = std::max(outer.max.x, list_origin.x + available_width);

  ImGui::SetCursorScreenPos(UI::to_imvec2(list_origin));
  ImGui::Dummy(UI::to_imvec2(outer.size()));
  return outer;
}

auto DragDropList::draw_background(const Math::Rect &outer, bool highlight)
    -> void {
  auto *draw_list = ImGui::GetWindowDrawList();
  splitter->SetCurrentChannel(draw_list, 0);
  const auto colour =
      ImGui::GetColorU32(highlight ? ImGuiCol_FrameBgActive : ImGuiCol_FrameBg);
  draw_list->AddRectFilled(UI::to_imvec2(outer.min), UI::to_imvec2(outer.max),
                           colour, ImGui::GetStyle().FrameRounding);
  splitter->Merge(draw_list);
}

auto DragDropList::begin_passive(std::string_view label) -> void {
  ImGui::PushID(label.data(), label.data() + label.size());
  begin_layout();
}

auto DragDropList::end_passive() -> void {
  draw_background(end_layout(), false);
  ImGui::PopID();
}

auto DragDropList::begin_list(std::string_view label) -> void {
  ImGui::PushID(label.data(), label.data() + label.size());

  const auto id = ImGui::GetID("##dnd_list");
  if (id != list_id) {
    list_id = id;
    const auto written =
        fmt::format_to_n(preview_window_name.data(),
                         preview_window_name.size() - 1,
                         "##dnd_preview_{:08X}", list_id);
    *written.out = '\0';
  }

  resolve_dragged_item();

  const auto count = item_ids.size();
  rects.assign(count, Math::Rect{});
  visual_order.resize(count);
  std::iota(visual_order.begin(), visual_order.end(), usize{0});
  if (const auto indices = session.indices()) {
    Container::shift(indices->source, std::min(indices->target, count - 1),
                     visual_order);
  }

  begin_layout();
}

auto DragDropList::end_list() -> DragDropResponse {
  list_bounds = end_layout();

  auto response = DragDropResponse::no_drag();
  bool hovered = false;

  if (session.is_dragging()) {
    const auto pointer = UI::mouse_position();
    if (should_cancel()) {
      cancel();
    } else {
      session.update_target(pointer, list_bounds, rects);
      hovered = list_bounds.contains(pointer);

      if (ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        response = session.release();
        release_active_id();
      } else if (!ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
        debug("Pointer released outside of a frame, cancelling drag");
        cancel();
      } else {
        response = session.response();
        ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
      }
    }
  }

  draw_background(list_bounds, hovered && options.highlight_drop_target);
  ImGui::PopID();
  return response;
}

auto DragDropList::slot_for(usize index) const -> Slot {
  const auto indices = session.indices();
  if (!indices || indices->source != index) {
    return Slot::Item;
  }
  return options.draw_drop_preview ? Slot::Placeholder : Slot::Gap;
}

auto DragDropList::handle_mode_for(Slot slot) const -> HandleMode {
  if (slot == Slot::Placeholder) {
    return HandleMode::Placeholder;
  }
  return session.is_dragging() ? HandleMode::Inert : HandleMode::Interactive;
}

auto DragDropList::current_handle_id() const -> ImGuiID {
  return ImGui::GetID("##dnd_handle");
}

auto DragDropList::begin_item(usize index, Slot slot) -> void {
  push_item_id(item_ids[index]);
  item_origin = UI::to_vec2(ImGui::GetCursorScreenPos());
  ImGui::BeginGroup();

  switch (slot) {
  case Slot::Item:
    break;
  case Slot::Placeholder:
    ImGui::KeepAliveID(current_handle_id());
    ImGui::BeginDisabled();
    break;
  case Slot::Gap:
    ImGui::KeepAliveID(current_handle_id());
    ImGui::Dummy(UI::to_imvec2(preview_size));
    break;
  }
}

auto DragDropList::end_item(usize index, Slot slot) -> void {
  if (slot == Slot::Placeholder) {
    ImGui::EndDisabled();
  }
  ImGui::EndGroup();
  rects[index] = UI::last_item_rect();

  if (slot != Slot::Item) {
    const auto marker = rects[index].expanded(Math::Vec2{1.0F});
    ImGui::GetWindowDrawList()->AddRect(
        UI::to_imvec2(marker.min), UI::to_imvec2(marker.max),
        ImGui::GetColorU32(ImGuiCol_DragDropTarget),
        ImGui::GetStyle().FrameRounding, 0, Config::marker_thickness);
  }
  ImGui::PopID();
}

auto DragDropList::begin_preview() -> bool {
  auto pointer = session.pointer();
  if (ImGui::IsMousePosValid()) {
    pointer = UI::mouse_position();
  }

  const auto padding = UI::to_vec2(ImGui::GetStyle().WindowPadding);
  ImGui::SetNextWindowPos(
      UI::to_imvec2(pointer + session.drag_delta() - padding));
  ImGui::SetNextWindowBgAlpha(Config::preview_alpha);

  const bool visible =
      ImGui::Begin(preview_window_name.data(), nullptr, preview_window_flags);
  if (visible) {
    ImGui::BeginGroup();
  }
  return visible;
}

auto DragDropList::end_preview(bool visible) -> void {
  if (visible) {
    ImGui::EndGroup();
    preview_size = UI::last_item_rect().size();
  }
  ImGui::End();
}

auto DragDropList::resolve_dragged_item() -> void {
  const auto dragged = session.dragged_item();
  if (!dragged) {
    return;
  }

  const auto found = std::ranges::find(item_ids, *dragged);
  if (found == item_ids.end()) {
    debug("Dragged item {:#x} is no longer part of the list", *dragged);
    cancel();
    return;
  }
  session.resolve_source(
      static_cast<usize>(std::distance(item_ids.begin(), found)));
}

auto DragDropList::on_handle_pressed(ImGuiID id, usize index) -> void {
  if (session.begin(item_ids[index], index, UI::mouse_position(),
                    item_origin)) {
    dragged_handle = id;
    trace("Handle {:#010x} pressed in list {:#010x}, last bounds {}", id,
          list_id, list_bounds);
  }
}

auto DragDropList::should_cancel() const -> bool {
  return ImGui::IsKeyPressed(ImGuiKey_Escape, false) ||
         ImGui::GetIO().AppFocusLost;
}

} // namespace DnD
