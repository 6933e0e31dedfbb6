#pragma once

#include "Types.hpp"

#include <glm/glm.hpp>

namespace DnD::Math {

using Vec2 = glm::vec2;

struct Rect {
  Vec2 min{0.0F};
  Vec2 max{0.0F};

  [[nodiscard]] auto width() const -> floating { return max.x - min.x; }
  [[nodiscard]] auto height() const -> floating { return max.y - min.y; }
  [[nodiscard]] auto size() const -> Vec2 { return max - min; }
  [[nodiscard]] auto center() const -> Vec2 { return (min + max) * 0.5F; }

  [[nodiscard]] auto contains(const Vec2 &point) const -> bool {
    return point.x >= min.x && point.y >= min.y && point.x < max.x &&
           point.y < max.y;
  }

  [[nodiscard]] auto expanded(const Vec2 &amount) const -> Rect {
    return {min - amount, max + amount};
  }

  auto operator==(const Rect &) const -> bool = default;
};

} // namespace DnD::Math
