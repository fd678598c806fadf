/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POLYGON_ROOM_AREA_HPP
#define POLYGON_ROOM_AREA_HPP

#include "host/HostInterfaces.hpp"
#include <string>
#include <vector>

namespace AccessOverlay {

// Room area backed by a closed polygon (even-odd rule). Hosts whose room
// colliders are polygons can hand their vertices over directly.
class PolygonRoomArea : public IRoomArea {
public:
  PolygonRoomArea(std::string rawName, std::vector<Vector2D> vertices);

  // Axis-aligned rectangle convenience
  static PolygonRoomArea rectangle(std::string rawName, const Vector2D &min,
                                   const Vector2D &max);

  std::string rawName() const override { return m_rawName; }
  bool containsPoint(const Vector2D &point) const override;
  AABB bounds() const override { return m_bounds; }

  const std::vector<Vector2D> &vertices() const { return m_vertices; }

private:
  std::string m_rawName;
  std::vector<Vector2D> m_vertices;
  AABB m_bounds;
};

} // namespace AccessOverlay

#endif // POLYGON_ROOM_AREA_HPP
