/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

#include <algorithm>

namespace AccessOverlay {

AABB AABB::fromMinMax(const Vector2D& min, const Vector2D& max) {
    Vector2D const half = (max - min) * 0.5f;
    Vector2D const mid = min + half;
    return AABB(mid.getX(), mid.getY(), half.getX(), half.getY());
}

AABB AABB::enclosing(const std::vector<Vector2D>& points) {
    if (points.empty()) {
        return AABB{};
    }

    float minX = points.front().getX();
    float maxX = minX;
    float minY = points.front().getY();
    float maxY = minY;
    for (const auto& p : points) {
        minX = std::min(minX, p.getX());
        maxX = std::max(maxX, p.getX());
        minY = std::min(minY, p.getY());
        maxY = std::max(maxY, p.getY());
    }
    return fromMinMax(Vector2D(minX, minY), Vector2D(maxX, maxY));
}

bool AABB::isDegenerate() const {
    return halfSize.getX() <= 0.0f || halfSize.getY() <= 0.0f;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= minX() && p.getX() <= maxX() &&
           p.getY() >= minY() && p.getY() <= maxY();
}

} // namespace AccessOverlay
