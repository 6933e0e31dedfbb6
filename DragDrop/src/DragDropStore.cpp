#include "dnd/DragDropStore.hpp"

#include "Logger.hpp"

#include <algorithm>

namespace DnD {

auto DragDropStore::get(ImGuiID id) -> DragDropList & {
  const auto frame = ImGui::GetFrameCount();
  auto [it, inserted] = lists.try_emplace(id, default_options, frame);
  if (inserted) {
    trace("Created drag and drop list {:#010x}", id);
  }
  it->second.last_used_frame = frame;
  return it->second.list;
}

auto DragDropStore::get(std::string_view label) -> DragDropList & {
  return get(ImGui::GetID(label.data(), label.data() + label.size()));
}

auto DragDropStore::collect_garbage(i32 max_idle_frames) -> usize {
  const auto frame = ImGui::GetFrameCount();
  const auto collected = std::erase_if(lists, [&](const auto &pair) {
    return frame - pair.second.last_used_frame > max_idle_frames;
  });
  if (collected > 0) {
    debug("Collected {} idle drag and drop lists, {} remain", collected,
          lists.size());
  }
  return static_cast<usize>(collected);
}

auto DragDropStore::reset(ImGuiID id) -> bool {
  const auto it = lists.find(id);
  if (it == lists.end()) {
    return false;
  }
  it->second.list.cancel();
  lists.erase(it);
  return true;
}

auto DragDropStore::clear() -> void {
  for (auto &&[id, entry] : lists) {
    trace("Dropping drag and drop list {:#010x}", id);
    entry.list.cancel();
  }
  lists.clear();
}

auto DragDropStore::any_dragging() const -> bool {
  return std::ranges::any_of(lists, [](const auto &pair) {
    return pair.second.list.is_dragging();
  });
}

} // namespace DnD
