#include "Formatters.hpp"

#include <fmt/format.h>

auto fmt::formatter<DnD::Math::Rect>::format(const DnD::Math::Rect &rect,
                                            format_context &ctx) const
    -> decltype(ctx.out()) {
  return formatter<std::string_view>::format(
      fmt::format("[{} -> {}]", rect.min, rect.max), ctx);
}
