#include "ReorderWidget.hpp"

#include "Containers.hpp"
#include "Exception.hpp"
#include "Logger.hpp"
#include "UI.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <imgui.h>
#include <ranges>
#include <utility>

auto make_default_tree() -> std::vector<NamedItem> {
  return {
      {.name = "a"},
      {.name = "b"},
      {.name = "c"},
      {.name = "d"},
      {.name = "e",
       .children =
           {
               {.name = "e_a"},
               {.name = "e_b"},
               {.name = "e_c"},
               {.name = "e_d"},
           }},
  };
}

ReorderWidget::ReorderWidget() : items(make_default_tree()) {}

void ReorderWidget::on_create() {
  info("Reorder widget created with {} top level items", items.size());
}

void ReorderWidget::on_destroy() {
  root_list.cancel();
  child_lists.clear();
}

void ReorderWidget::on_update(floating) {}

void ReorderWidget::on_interface(InterfaceSystem &) {
  ImGui::SetNextWindowSize({360.0F, 520.0F}, ImGuiCond_FirstUseEver);
  UI::widget("Drag and drop", [this]() {
    current_path.clear();
    const auto response = draw_level(items, root_list, "items");
    if (const auto indices = response.indices(); response.is_dragging()) {
      UI::text_disabled("Dragging {}", *indices);
    } else {
      UI::text_disabled("Drag a row by its handle");
    }
    apply_pending_move();

    ImGui::Separator();
    draw_options();
    draw_move_log();
  });

  child_lists.collect_garbage();
}

auto ReorderWidget::draw_level(const std::vector<NamedItem> &level,
                               DragDropList &list, std::string_view label)
    -> DragDropResponse {
  const auto response = list.list_ui(
      label, level,
      [this](DragHandle &handle, usize index, const NamedItem &item) {
        handle.ui([] { ImGui::TextDisabled("::"); });
        ImGui::SameLine();

        if (item.children.empty()) {
          ImGui::TextUnformatted(item.name.c_str());
          return;
        }

        if (ImGui::TreeNodeEx(item.name.c_str(),
                              ImGuiTreeNodeFlags_DefaultOpen)) {
          current_path.push_back(index);
          static_cast<void>(
              draw_level(item.children, child_lists.get("children"), "children"));
          current_path.pop_back();
          ImGui::TreePop();
        }
      });

  if (const auto moved = response.completed_indices()) {
    pending_move = PendingMove{.path = current_path, .indices = *moved};
  }
  return response;
}

auto ReorderWidget::apply_pending_move() -> void {
  if (!pending_move) {
    return;
  }

  const auto [path, indices] = *std::exchange(pending_move, std::nullopt);

  auto *level = &items;
  std::string parent{"root"};
  for (const auto index : path) {
    parent = (*level)[index].name;
    level = &(*level)[index].children;
  }

  try {
    Container::shift_checked(indices.source, indices.target, *level);
    const auto &moved = (*level)[indices.target].name;

    auto entry = fmt::format("Moved '{}' in {} from {} to {}", moved, parent,
                             indices.source, indices.target);
    info("{}", entry);
    move_log.push_front(std::move(entry));
    if (move_log.size() > max_logged_moves) {
      move_log.pop_back();
    }
  } catch (const InvalidIndicesException &exc) {
    error("Could not apply move: {}", exc.what());
  }
}

auto ReorderWidget::draw_options() -> void {
  if (!ImGui::CollapsingHeader("Options", ImGuiTreeNodeFlags_DefaultOpen)) {
    return;
  }

  auto &options = root_list.get_options();
  bool changed = ImGui::Checkbox("Draw drop preview", &options.draw_drop_preview);
  changed |= ImGui::Checkbox("Highlight drop target",
                             &options.highlight_drop_target);
  if (changed) {
    child_lists.get_default_options() = options;
    // Child lists pick the new options up when they are recreated.
    child_lists.clear();
    debug("Drop preview {}, highlight {}", options.draw_drop_preview,
          options.highlight_drop_target);
  }

  if (ImGui::Button("Reset tree")) {
    reset();
  }
  ImGui::SameLine();
  UI::text_disabled("{} lists alive", child_lists.size() + 1);
}

auto ReorderWidget::draw_move_log() -> void {
  if (!ImGui::CollapsingHeader("Moves", ImGuiTreeNodeFlags_DefaultOpen)) {
    return;
  }

  if (move_log.empty()) {
    UI::text_disabled("Nothing moved yet");
    return;
  }
  for (const auto &entry : move_log) {
    UI::text("{}", entry);
  }
}

auto ReorderWidget::reset() -> void {
  root_list.cancel();
  child_lists.clear();
  items = make_default_tree();
  pending_move.reset();
  move_log.clear();

  const auto names =
      items | std::views::transform([](const auto &item) -> std::string_view {
        return item.name;
      });
  info("Tree reset to [{}]", fmt::join(names, ", "));
}
