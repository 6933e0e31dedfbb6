#pragma once

#include "Config.hpp"
#include "Math.hpp"
#include "Types.hpp"

#include <array>
#include <concepts>
#include <imgui.h>
#include <ranges>
#include <span>
#include <string_view>
#include <vector>

#include "dnd/DragSession.hpp"
#include "dnd/DragableItem.hpp"

namespace DnD {

struct DragDropOptions {
  // Draw the dragged item disabled at its drop slot instead of an empty gap.
  bool draw_drop_preview{Config::draw_drop_preview};
  bool highlight_drop_target{true};
  floating margin{Config::list_margin};
};

enum class HandleMode : u8 {
  Interactive,
  Inert,
  Placeholder,
  Passive,
};

class DragDropList;

/// The part of an item that starts a drag. Handed to the item callback of
/// `DragDropList::list_ui`, which should call `ui` exactly once per item.
class DragHandle {
public:
  template <class Func> auto ui(Func &&contents) -> void {
    ImGui::BeginGroup();
    std::forward<Func>(contents)();
    ImGui::EndGroup();
    interact();
  }

  [[nodiscard]] auto mode() const -> HandleMode { return handle_mode; }
  [[nodiscard]] auto is_placeholder() const -> bool {
    return handle_mode == HandleMode::Placeholder;
  }
  [[nodiscard]] auto index() const -> usize { return item_index; }

private:
  friend class DragDropList;

  DragHandle(DragDropList *list, ImGuiID id, usize index, HandleMode mode)
      : owner(list), handle_id(id), item_index(index), handle_mode(mode) {}

  auto interact() -> void;

  DragDropList *owner{nullptr};
  ImGuiID handle_id{0};
  usize item_index{0};
  HandleMode handle_mode{HandleMode::Passive};
};

/// A vertically reorderable list. Holds the drag state of one list and draws
/// the host's items every frame; it never modifies the items themselves.
///
/// \code
/// auto response = list.list_ui("names", names,
///     [](DnD::DragHandle &handle, DnD::usize, const std::string &name) {
///       handle.ui([] { ImGui::TextUnformatted("::"); });
///       ImGui::SameLine();
///       ImGui::TextUnformatted(name.c_str());
///     });
/// if (const auto moved = response.completed_indices()) {
///   DnD::Container::shift(moved->source, moved->target, names);
/// }
/// \endcode
class DragDropList {
public:
  explicit DragDropList(DragDropOptions list_options = {})
      : options(list_options),
        splitter(make_scope<ImDrawListSplitter>()) {}

  DragDropList(const DragDropList &) = delete;
  auto operator=(const DragDropList &) -> DragDropList & = delete;
  DragDropList(DragDropList &&) = default;
  auto operator=(DragDropList &&) -> DragDropList & = default;
  ~DragDropList() = default;

  template <std::ranges::random_access_range Range, class ItemUi>
    requires DragableItem<std::ranges::range_value_t<Range>> &&
             std::invocable<ItemUi &, DragHandle &, usize,
                            std::ranges::range_reference_t<const Range>>
  auto list_ui(std::string_view label, const Range &items, ItemUi &&item_ui)
      -> DragDropResponse;

  auto cancel() -> void;

  [[nodiscard]] auto get_session() const -> const DragSession & {
    return session;
  }
  [[nodiscard]] auto get_options() -> DragDropOptions & { return options; }
  [[nodiscard]] auto get_options() const -> const DragDropOptions & {
    return options;
  }
  [[nodiscard]] auto is_dragging() const -> bool {
    return session.is_dragging();
  }
  /// Rectangles of the items drawn by the last live frame, by logical index.
  [[nodiscard]] auto item_rects() const -> std::span<const Math::Rect> {
    return rects;
  }
  [[nodiscard]] auto bounds() const -> const Math::Rect & {
    return list_bounds;
  }

  /// True while drawing a floating copy or a drop preview. Lists drawn in
  /// that state do not react to input.
  [[nodiscard]] static auto is_rendering_passively() -> bool {
    return passive_depth > 0;
  }

private:
  friend class DragHandle;

  enum class Slot : u8 { Item, Placeholder, Gap };

  // Marks the host callbacks it encloses as passive rendering.
  class PassiveGuard {
  public:
    explicit PassiveGuard(bool enabled = true) : active(enabled) {
      if (active) {
        ++passive_depth;
      }
    }
    ~PassiveGuard() {
      if (active) {
        --passive_depth;
      }
    }
    PassiveGuard(const PassiveGuard &) = delete;
    auto operator=(const PassiveGuard &) -> PassiveGuard & = delete;

  private:
    bool active;
  };

  DragDropOptions options;
  DragSession session;

  std::vector<ItemId> item_ids;
  std::vector<Math::Rect> rects;
  std::vector<usize> visual_order;
  // Owns heap channels that must not be shared between copies.
  Scope<ImDrawListSplitter> splitter;

  Math::Rect list_bounds{};
  Math::Vec2 list_origin{0.0F};
  floating available_width{0.0F};
  Math::Vec2 item_origin{0.0F};
  Math::Vec2 preview_size{0.0F};
  ImGuiID list_id{0};
  ImGuiID dragged_handle{0};
  std::array<char, 32> preview_window_name{};

  static inline u32 passive_depth{0};

  static auto push_item_id(ItemId) -> void;

  auto begin_layout() -> void;
  auto end_layout() -> Math::Rect;
  auto draw_background(const Math::Rect &outer, bool highlight) -> void;
  auto begin_passive(std::string_view label) -> void;
  auto end_passive() -> void;

  auto begin_list(std::string_view label) -> void;
  auto end_list() -> DragDropResponse;
  [[nodiscard]] auto slot_for(usize index) const -> Slot;
  [[nodiscard]] auto handle_mode_for(Slot slot) const -> HandleMode;
  [[nodiscard]] auto current_handle_id() const -> ImGuiID;
  auto begin_item(usize index, Slot slot) -> void;
  auto end_item(usize index, Slot slot) -> void;
  auto begin_preview() -> bool;
  auto end_preview(bool visible) -> void;

  auto resolve_dragged_item() -> void;
  auto on_handle_pressed(ImGuiID id, usize index) -> void;
  [[nodiscard]] auto should_cancel() const -> bool;
  auto release_active_id() -> void;
};

} // namespace DnD

#include "DragDropList.inl"
