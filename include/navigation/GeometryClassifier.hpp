/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GEOMETRY_CLASSIFIER_HPP
#define GEOMETRY_CLASSIFIER_HPP

#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string>

namespace AccessOverlay {

// Screen-relative direction of a target, +y is up
enum class CardinalDirection : uint8_t {
  RIGHT,
  UP_RIGHT,
  UP,
  UP_LEFT,
  LEFT,
  DOWN_LEFT,
  DOWN,
  DOWN_RIGHT
};

// Compass direction a player entered a room from
enum class CompassDirection : uint8_t { EAST, SOUTH, WEST, NORTH };

/**
 * @brief Stateless vector-to-language classification.
 *
 * All functions are total. Angles are measured in degrees and normalised
 * into [0, 360); every sector is half-open so a boundary angle belongs to
 * the sector that starts there.
 */
namespace GeometryClassifier {

/**
 * @brief Eight 45 degree sectors centred on right, up-right, up, ...
 * @param offset Vector from the observer to the target
 *
 * A zero vector classifies as RIGHT (atan2(0, 0) == 0).
 */
CardinalDirection cardinalDirection(const Vector2D &offset);

/**
 * @brief Four 90 degree compass sectors with the vertical axis flipped
 * @param movement Vector from the new entry point back to the previous one
 */
CompassDirection entryDirection(const Vector2D &movement);

/**
 * @brief Quadrant phrase for a point inside bounds
 * @return "center of the", "<vertical> <horizontal> of the", or "" when the
 *         bounds have no area
 */
std::string roomRelativePosition(const Vector2D &point, const AABB &bounds);

// Rounds to the nearest 0.1 unit
float roundDistance(float distance);

// Shortest decimal form of the rounded distance ("4.2", "4")
std::string formatDistance(float distance);

const char *toString(CardinalDirection direction);
const char *toString(CompassDirection direction);

} // namespace GeometryClassifier

} // namespace AccessOverlay

#endif // GEOMETRY_CLASSIFIER_HPP
