/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

#include <vector>

namespace AccessOverlay {

// Axis-aligned bounds in host world space (y grows upward).
struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    static AABB fromMinMax(const Vector2D& min, const Vector2D& max);
    // Smallest box enclosing every point; empty input gives a zero box at the origin
    static AABB enclosing(const std::vector<Vector2D>& points);

    float minX() const { return center.getX() - halfSize.getX(); }
    float maxX() const { return center.getX() + halfSize.getX(); }
    float minY() const { return center.getY() - halfSize.getY(); }
    float maxY() const { return center.getY() + halfSize.getY(); }

    Vector2D min() const { return Vector2D(minX(), minY()); }
    Vector2D size() const { return halfSize * 2.0f; }

    bool isDegenerate() const;
    bool contains(const Vector2D& p) const;
};

} // namespace AccessOverlay

#endif // AABB_HPP
