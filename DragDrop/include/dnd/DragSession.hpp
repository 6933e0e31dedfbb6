#pragma once

#include "FiniteStateMachine.hpp"
#include "Math.hpp"
#include "Types.hpp"

#include <fmt/format.h>
#include <optional>
#include <span>
#include <string_view>

#include "dnd/DragableItem.hpp"

namespace DnD {

struct DragIndices {
  usize source{0};
  usize target{0};

  auto operator==(const DragIndices &) const -> bool = default;
};

enum class DragPhase : u8 { Idle, Dragging };

enum class ResponseKind : u8 { NoDrag, CurrentDrag, Completed };

/// Result of one frame of a list. `CurrentDrag` carries the indices the drag
/// would produce if released now, `Completed` the ones the host should apply.
class DragDropResponse {
public:
  DragDropResponse() = default;

  static auto no_drag() -> DragDropResponse { return {}; }
  static auto current_drag(DragIndices indices) -> DragDropResponse {
    return DragDropResponse{ResponseKind::CurrentDrag, indices};
  }
  static auto completed(DragIndices indices) -> DragDropResponse {
    return DragDropResponse{ResponseKind::Completed, indices};
  }

  [[nodiscard]] auto kind() const -> ResponseKind { return response_kind; }
  [[nodiscard]] auto is_dragging() const -> bool {
    return response_kind == ResponseKind::CurrentDrag;
  }
  [[nodiscard]] auto is_completed() const -> bool {
    return response_kind == ResponseKind::Completed;
  }
  [[nodiscard]] auto indices() const -> std::optional<DragIndices> {
    if (response_kind == ResponseKind::NoDrag) {
      return std::nullopt;
    }
    return drag_indices;
  }
  [[nodiscard]] auto completed_indices() const -> std::optional<DragIndices> {
    if (!is_completed()) {
      return std::nullopt;
    }
    return drag_indices;
  }

private:
  DragDropResponse(ResponseKind kind, DragIndices indices)
      : response_kind(kind), drag_indices(indices) {}

  ResponseKind response_kind{ResponseKind::NoDrag};
  DragIndices drag_indices{};
};

/// Per-list drag state. Idle until a handle is pressed, then tracks the dragged
/// identity, its source index and the slot it would be dropped into.
class DragSession : public FiniteStateMachine<DragPhase> {
public:
  DragSession() : FiniteStateMachine<DragPhase>(DragPhase::Idle) {}

  /// Starts a drag of `item` found at `source`. `item_origin` is the top left
  /// corner of the item when the press happened. Fails if a drag is active.
  auto begin(ItemId item, usize source, const Math::Vec2 &pointer,
             const Math::Vec2 &item_origin) -> bool;

  /// Re-anchors the source to where the dragged identity was found this frame.
  auto resolve_source(usize index) -> void;

  /// Recomputes the candidate target from the pointer and the rectangles of
  /// every item of this frame, indexed by logical position.
  auto update_target(const Math::Vec2 &pointer, const Math::Rect &list_bounds,
                     std::span<const Math::Rect> item_rects) -> usize;

  /// Ends the drag. Completed only if the item would actually move.
  auto release() -> DragDropResponse;
  auto cancel() -> void;

  [[nodiscard]] auto is_dragging() const -> bool {
    return is(DragPhase::Dragging);
  }
  [[nodiscard]] auto dragged_item() const -> std::optional<ItemId>;
  [[nodiscard]] auto indices() const -> std::optional<DragIndices>;
  [[nodiscard]] auto drag_delta() const -> Math::Vec2;
  [[nodiscard]] auto pointer() const -> Math::Vec2;
  [[nodiscard]] auto response() const -> DragDropResponse;

protected:
  auto on_enter_state(DragPhase state) -> void override;
  auto on_leave_state(DragPhase state) -> void override;

private:
  struct ActiveDrag {
    ItemId item{0};
    DragIndices indices{};
    Math::Vec2 pointer{0.0F};
    // Item origin relative to the pointer, captured when the drag began.
    Math::Vec2 drag_delta{0.0F};
  };
  std::optional<ActiveDrag> active{};

  auto finish() -> void;
};

} // namespace DnD

template <>
struct fmt::formatter<DnD::DragIndices> : formatter<std::string_view> {
  auto format(const DnD::DragIndices &indices, format_context &ctx) const
      -> decltype(ctx.out());
};
