/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/PolygonRoomArea.hpp"
#include <utility>

namespace AccessOverlay {

PolygonRoomArea::PolygonRoomArea(std::string rawName,
                                 std::vector<Vector2D> vertices)
    : m_rawName(std::move(rawName)), m_vertices(std::move(vertices)),
      m_bounds(AABB::enclosing(m_vertices)) {}

PolygonRoomArea PolygonRoomArea::rectangle(std::string rawName,
                                           const Vector2D &min,
                                           const Vector2D &max) {
  return PolygonRoomArea(std::move(rawName),
                         {min, Vector2D(max.getX(), min.getY()), max,
                          Vector2D(min.getX(), max.getY())});
}

bool PolygonRoomArea::containsPoint(const Vector2D &point) const {
  if (m_vertices.size() < 3) {
    return false;
  }

  // Cheap reject before the crossing test
  if (!m_bounds.contains(point)) {
    return false;
  }

  bool inside = false;
  float const px = point.getX();
  float const py = point.getY();
  for (size_t i = 0, j = m_vertices.size() - 1; i < m_vertices.size(); j = i++) {
    float const xi = m_vertices[i].getX();
    float const yi = m_vertices[i].getY();
    float const xj = m_vertices[j].getX();
    float const yj = m_vertices[j].getY();

    if ((yi > py) != (yj > py)) {
      float const crossX = (xj - xi) * (py - yi) / (yj - yi) + xi;
      if (px < crossX) {
        inside = !inside;
      }
    }
  }
  return inside;
}

} // namespace AccessOverlay
