#pragma once

#include "Config.hpp"
#include "Types.hpp"

#include <imgui.h>
#include <string_view>
#include <unordered_map>

#include "dnd/DragDropList.hpp"

namespace DnD {

/// Owns one `DragDropList` per ImGui ID path, for hosts that draw a varying
/// number of lists, such as the children of a tree.
class DragDropStore {
public:
  explicit DragDropStore(DragDropOptions options = {})
      : default_options(options) {}

  auto get(ImGuiID id) -> DragDropList &;
  /// Resolves `label` in the current ImGui ID stack.
  auto get(std::string_view label) -> DragDropList &;

  /// Drops the lists that were not requested in the last `max_idle_frames`
  /// frames. Returns how many were dropped.
  auto collect_garbage(i32 max_idle_frames = Config::store_idle_frames)
      -> usize;

  auto reset(ImGuiID id) -> bool;
  auto clear() -> void;

  [[nodiscard]] auto size() const -> usize { return lists.size(); }
  [[nodiscard]] auto contains(ImGuiID id) const -> bool {
    return lists.contains(id);
  }
  [[nodiscard]] auto any_dragging() const -> bool;
  [[nodiscard]] auto get_default_options() -> DragDropOptions & {
    return default_options;
  }

private:
  struct Entry {
    Entry(const DragDropOptions &options, i32 frame)
        : list(options), last_used_frame(frame) {}

    DragDropList list;
    i32 last_used_frame{0};
  };

  DragDropOptions default_options;
  std::unordered_map<ImGuiID, Entry> lists;
};

} // namespace DnD
