#include "dnd/DragSession.hpp"

#include "Formatters.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <magic_enum.hpp>

namespace DnD {

auto DragSession::begin(ItemId item, usize source, const Math::Vec2 &pointer,
                        const Math::Vec2 &item_origin) -> bool {
  if (is_dragging()) {
    return false;
  }

  active = ActiveDrag{
      .item = item,
      .indices = {.source = source, .target = source},
      .pointer = pointer,
      .drag_delta = item_origin - pointer,
  };
  transition_to(DragPhase::Dragging);
  debug("Drag started: item {:#x} at index {}, pointer {}", item, source,
        pointer);
  return true;
}

auto DragSession::resolve_source(usize index) -> void {
  if (!active) {
    return;
  }

  if (active->indices.source != index) {
    trace("Dragged item {:#x} moved from index {} to {}", active->item,
          active->indices.source, index);
    active->indices.source = index;
  }
}

auto DragSession::update_target(const Math::Vec2 &pointer,
                                const Math::Rect &list_bounds,
                                std::span<const Math::Rect> item_rects)
    -> usize {
  if (!active) {
    return 0;
  }

  auto &indices = active->indices;
  active->pointer = pointer;

  if (item_rects.empty()) {
    indices.target = 0;
    return indices.target;
  }
  indices.source = std::min(indices.source, item_rects.size() - 1);

  if (!list_bounds.contains(pointer)) {
    // Not hovering this list, dropping now changes nothing.
    indices.target = indices.source;
    return indices.target;
  }

  // The dragged item lands after every sibling whose midpoint is above the
  // pointer, so the count of those siblings is its final position.
  usize crossed = 0;
  for (usize i = 0; i < item_rects.size(); ++i) {
    if (i == indices.source) {
      continue;
    }
    if (item_rects[i].center().y < pointer.y) {
      ++crossed;
    }
  }
  indices.target = crossed;
  return indices.target;
}

auto DragSession::release() -> DragDropResponse {
  if (!active) {
    return DragDropResponse::no_drag();
  }

  const auto indices = active->indices;
  finish();

  if (indices.source == indices.target) {
    debug("Drag released in place at index {}", indices.source);
    return DragDropResponse::no_drag();
  }

  debug("Drag completed: {}", indices);
  return DragDropResponse::completed(indices);
}

auto DragSession::cancel() -> void {
  if (!active) {
    return;
  }

  debug("Drag of item {:#x} cancelled", active->item);
  finish();
}

auto DragSession::finish() -> void {
  active.reset();
  transition_to(DragPhase::Idle);
}

auto DragSession::dragged_item() const -> std::optional<ItemId> {
  if (!active) {
    return std::nullopt;
  }
  return active->item;
}

auto DragSession::indices() const -> std::optional<DragIndices> {
  if (!active) {
    return std::nullopt;
  }
  return active->indices;
}

auto DragSession::drag_delta() const -> Math::Vec2 {
  return active ? active->drag_delta : Math::Vec2{0.0F};
}

auto DragSession::pointer() const -> Math::Vec2 {
  return active ? active->pointer : Math::Vec2{0.0F};
}

auto DragSession::response() const -> DragDropResponse {
  if (!active) {
    return DragDropResponse::no_drag();
  }
  return DragDropResponse::current_drag(active->indices);
}

auto DragSession::on_enter_state(DragPhase state) -> void {
  trace("DragSession entering {}", magic_enum::enum_name(state));
}

auto DragSession::on_leave_state(DragPhase state) -> void {
  trace("DragSession leaving {}", magic_enum::enum_name(state));
}

} // namespace DnD

auto fmt::formatter<DnD::DragIndices>::format(const DnD::DragIndices &indices,
                                             format_context &ctx) const
    -> decltype(ctx.out()) {
  return formatter<std::string_view>::format(
      fmt::format("{} -> {}", indices.source, indices.target), ctx);
}
