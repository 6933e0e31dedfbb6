#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace DnD {

template <class T>
concept IsEnum = std::is_enum_v<T>;

template <class T>
concept IsNumber = std::is_arithmetic_v<T>;

template <class T>
concept IsHashable = requires(const T &t) {
  { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
};

template <class T>
concept HasDragId = requires(const T &t) {
  { t.drag_id() } -> std::convertible_to<std::uint64_t>;
};

} // namespace DnD
