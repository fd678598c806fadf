/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/VisibilityProbe.hpp"
#include <array>

namespace AccessOverlay {

bool VisibilityProbe::isVisible(const Vector2D &observer,
                                const Vector2D &target) const {
  float const travel = Vector2D::distance(observer, target);
  if (travel <= 0.0f) {
    return true;
  }

  std::array<Vector2D, 5> const samples{
      target,
      target + Vector2D(m_buffer, 0.0f),
      target + Vector2D(-m_buffer, 0.0f),
      target + Vector2D(0.0f, m_buffer),
      target + Vector2D(0.0f, -m_buffer),
  };

  for (const auto &sample : samples) {
    Vector2D const direction = sample - observer;
    if (direction.isNearlyZero()) {
      return true;
    }

    auto const hit =
        m_raycaster.raycast(observer, direction, travel, m_blockingMask);
    if (!hit) {
      return true;
    }
    if (Vector2D::distance(hit->point, sample) < m_buffer) {
      return true;
    }
  }

  return false;
}

} // namespace AccessOverlay
