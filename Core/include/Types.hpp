#pragma once

#include "Concepts.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace DnD {

using usize = std::size_t;
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

#ifdef DND_DOUBLE_PRECISION
using floating = std::double_t;
#else
using floating = std::float_t;
#endif

namespace Detail {
struct DefaultDelete {
  template <class T> auto operator()(T *ptr) const noexcept -> void {
    delete ptr;
  }
};
} // namespace Detail

template <class T, class Deleter = Detail::DefaultDelete>
using Scope = std::unique_ptr<T, Deleter>;

template <class T, class Deleter = Detail::DefaultDelete, typename... Args>
auto make_scope(Args &&...args) -> Scope<T, Deleter> {
  return Scope<T, Deleter>(new T{std::forward<Args>(args)...});
}

template <IsNumber T> struct Extent {
  T width{0};
  T height{0};

  [[nodiscard]] auto valid() const noexcept -> bool {
    return width > 0 && height > 0;
  }

  // Cast to another type Other, not the same as T
  template <typename Other>
    requires(!std::is_same_v<Other, T> &&
             (std::is_integral_v<Other> || std::is_floating_point_v<Other>))
  auto as() const {
    return Extent<Other>{
        .width = static_cast<Other>(width),
        .height = static_cast<Other>(height),
    };
  }

  auto operator==(const Extent &rhs) const -> bool = default;
  auto operator!=(const Extent &rhs) const -> bool = default;
};

} // namespace DnD
