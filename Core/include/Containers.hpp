#pragma once

#include "Exception.hpp"
#include "Types.hpp"

#include <algorithm>
#include <concepts>
#include <iterator>
#include <span>
#include <type_traits>

namespace DnD::Container {

template <typename T>
concept Container = requires(T t) {
  typename T::value_type;
  typename T::size_type;
  typename T::iterator;
  typename T::const_iterator;
  { t.begin() } -> std::convertible_to<typename T::iterator>;
  { t.end() } -> std::convertible_to<typename T::iterator>;
  { t.size() } -> std::convertible_to<typename T::size_type>;
  { t.empty() } -> std::convertible_to<bool>;
  std::data(t);
};

/// Moves the element at `source` to position `target`, shifting every element
/// in between by one slot. Other elements keep their relative order.
///
/// Requires `source < size` and `target < size`. Equal indices are a no-op.
template <class T>
auto shift(usize source, usize target, std::span<T> sequence) -> void {
  const auto first = sequence.begin();
  const auto src = static_cast<std::ptrdiff_t>(source);
  const auto dst = static_cast<std::ptrdiff_t>(target);
  if (source < target) {
    std::rotate(first + src, first + src + 1, first + dst + 1);
  } else if (target < source) {
    std::rotate(first + dst, first + src, first + src + 1);
  }
}

auto shift(usize source, usize target, Container auto &container) -> void {
  using Value = typename std::remove_cvref_t<decltype(container)>::value_type;
  shift<Value>(source, target, std::span<Value>{container});
}

template <class T>
auto shift_checked(usize source, usize target, std::span<T> sequence)
    -> void {
  if (source >= sequence.size() || target >= sequence.size()) {
    throw InvalidIndicesException(source, target, sequence.size());
  }
  shift(source, target, sequence);
}

auto shift_checked(usize source, usize target, Container auto &container)
    -> void {
  using Value = typename std::remove_cvref_t<decltype(container)>::value_type;
  shift_checked<Value>(source, target, std::span<Value>{container});
}

} // namespace DnD::Container
