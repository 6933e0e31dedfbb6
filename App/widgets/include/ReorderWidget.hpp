#pragma once

#include "Types.hpp"
#include "Widget.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dnd/DragDropList.hpp"
#include "dnd/DragDropStore.hpp"

using namespace DnD;

struct NamedItem {
  std::string name;
  std::vector<NamedItem> children{};

  [[nodiscard]] auto drag_id() const -> ItemId {
    return std::hash<std::string>{}(name);
  }
};

auto make_default_tree() -> std::vector<NamedItem>;

/// The "Drag and drop" window: a tree of named items where the top level and
/// every list of children can be reordered independently.
class ReorderWidget : public Widget {
public:
  ReorderWidget();

  void on_update(floating ts) override;
  void on_interface(InterfaceSystem &) override;
  void on_create() override;
  void on_destroy() override;

  [[nodiscard]] auto get_items() const -> const std::vector<NamedItem> & {
    return items;
  }

private:
  std::vector<NamedItem> items;
  DragDropList root_list;
  DragDropStore child_lists;

  // Moves are applied once the whole tree has been drawn.
  struct PendingMove {
    std::vector<usize> path;
    DragIndices indices;
  };
  std::optional<PendingMove> pending_move{};
  std::vector<usize> current_path{};

  static constexpr usize max_logged_moves = 8;
  std::deque<std::string> move_log{};

  auto draw_level(const std::vector<NamedItem> &, DragDropList &,
                  std::string_view label) -> DragDropResponse;
  auto apply_pending_move() -> void;
  auto draw_options() -> void;
  auto draw_move_log() -> void;
  auto reset() -> void;
};
