#pragma once

namespace DnD {

template <std::ranges::random_access_range Range, class ItemUi>
  requires DragableItem<std::ranges::range_value_t<Range>> &&
           std::invocable<ItemUi &, DragHandle &, usize,
                          std::ranges::range_reference_t<const Range>>
auto DragDropList::list_ui(std::string_view label, const Range &items,
                           ItemUi &&item_ui) -> DragDropResponse {
  using Difference = std::ranges::range_difference_t<const Range>;

  const auto count = static_cast<usize>(std::ranges::distance(items));
  const auto item_at = [first = std::ranges::begin(items)](
                           usize index) -> decltype(auto) {
    return first[static_cast<Difference>(index)];
  };

  if (is_rendering_passively()) {
    begin_passive(label);
    for (usize index = 0; index < count; ++index) {
      const auto &item = item_at(index);
      push_item_id(drag_id_of(item));
      DragHandle handle{this, 0, index, HandleMode::Passive};
      item_ui(handle, index, item);
      ImGui::PopID();
    }
    end_passive();
    return DragDropResponse::no_drag();
  }

  if (count == 0) {
    cancel();
    return DragDropResponse::no_drag();
  }

  item_ids.clear();
  for (usize index = 0; index < count; ++index) {
    item_ids.push_back(drag_id_of(item_at(index)));
  }

  begin_list(label);
  for (const auto index : visual_order) {
    const auto &item = item_at(index);
    const auto slot = slot_for(index);

    if (slot != Slot::Item) {
      // Floating copy under the pointer, drawn in its own window.
      const bool visible = begin_preview();
      if (visible) {
        const PassiveGuard passive;
        DragHandle preview{this, 0, index, HandleMode::Passive};
        item_ui(preview, index, item);
      }
      end_preview(visible);
    }

    begin_item(index, slot);
    if (slot != Slot::Gap) {
      const PassiveGuard passive{slot == Slot::Placeholder};
      DragHandle handle{this, current_handle_id(), index,
                        handle_mode_for(slot)};
      item_ui(handle, index, item);
    }
    end_item(index, slot);
  }
  return end_list();
}

} // namespace DnD
