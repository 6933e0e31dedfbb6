#pragma once

#include "Math.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <span>
#include <string_view>

template <> struct fmt::formatter<DnD::Math::Rect> : formatter<std::string_view> {
  auto format(const DnD::Math::Rect &rect, format_context &ctx) const
      -> decltype(ctx.out());
};

template <glm::length_t L, typename T, glm::qualifier Q>
struct fmt::formatter<glm::vec<L, T, Q>> : formatter<std::string_view> {
  auto format(const glm::vec<L, T, Q> &vector, format_context &ctx) const
      -> decltype(ctx.out()) {
    const auto span = std::span{glm::value_ptr(vector), L};
    return formatter<std::string_view>::format(
        fmt::format("({})", fmt::join(span, ", ")), ctx);
  }
};
