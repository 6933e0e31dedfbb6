#pragma once

#include "Concepts.hpp"
#include "Types.hpp"

#include <functional>

namespace DnD {

/// Identity of an item within one list. Must stay stable for as long as the
/// item is part of the list and be unique among its siblings.
using ItemId = u64;

/// An item either supplies its own identity through `drag_id()` or is hashed
/// with `std::hash`.
template <class T>
concept DragableItem = HasDragId<T> || IsHashable<T>;

template <DragableItem T> auto drag_id_of(const T &item) -> ItemId {
  if constexpr (HasDragId<T>) {
    return static_cast<ItemId>(item.drag_id());
  } else {
    return static_cast<ItemId>(std::hash<T>{}(item));
  }
}

} // namespace DnD
