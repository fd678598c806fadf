/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/GeometryClassifier.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace AccessOverlay {
namespace GeometryClassifier {

namespace {

constexpr float LOW_FRACTION = 0.33f;
constexpr float HIGH_FRACTION = 0.66f;

float normalizedDegrees(float y, float x) {
  float angle = std::atan2(y, x) * 180.0f / std::numbers::pi_v<float>;
  angle = std::fmod(angle + 360.0f, 360.0f);
  // fmod can round a tiny negative angle up to exactly 360
  if (angle >= 360.0f) {
    angle -= 360.0f;
  }
  return angle;
}

} // namespace

CardinalDirection cardinalDirection(const Vector2D &offset) {
  float const angle = normalizedDegrees(offset.getY(), offset.getX());
  // Shift by half a sector so every sector starts on a multiple of 45
  int const sector = static_cast<int>(std::floor((angle + 22.5f) / 45.0f)) % 8;
  return static_cast<CardinalDirection>(sector);
}

CompassDirection entryDirection(const Vector2D &movement) {
  float const angle = normalizedDegrees(-movement.getY(), movement.getX());

  if (angle >= 315.0f || angle < 45.0f)
    return CompassDirection::EAST;
  if (angle < 135.0f)
    return CompassDirection::NORTH;
  if (angle < 225.0f)
    return CompassDirection::WEST;
  return CompassDirection::SOUTH;
}

std::string roomRelativePosition(const Vector2D &point, const AABB &bounds) {
  if (bounds.isDegenerate()) {
    return "";
  }

  Vector2D const size = bounds.size();
  float const xFraction = (point.getX() - bounds.minX()) / size.getX();
  float const yFraction = (point.getY() - bounds.minY()) / size.getY();

  const char *horizontal = xFraction < LOW_FRACTION    ? "left"
                           : xFraction > HIGH_FRACTION ? "right"
                                                       : "middle";
  const char *vertical = yFraction < LOW_FRACTION    ? "bottom"
                         : yFraction > HIGH_FRACTION ? "top"
                                                     : "middle";

  std::string const h(horizontal);
  std::string const v(vertical);
  if (h == "middle" && v == "middle") {
    return "center of the";
  }
  return v + " " + h + " of the";
}

float roundDistance(float distance) {
  return std::round(distance * 10.0f) / 10.0f;
}

std::string formatDistance(float distance) {
  return std::format("{}", roundDistance(distance));
}

const char *toString(CardinalDirection direction) {
  switch (direction) {
  case CardinalDirection::RIGHT:
    return "right";
  case CardinalDirection::UP_RIGHT:
    return "up and right";
  case CardinalDirection::UP:
    return "up";
  case CardinalDirection::UP_LEFT:
    return "up and left";
  case CardinalDirection::LEFT:
    return "left";
  case CardinalDirection::DOWN_LEFT:
    return "down and left";
  case CardinalDirection::DOWN:
    return "down";
  case CardinalDirection::DOWN_RIGHT:
    return "down and right";
  }
  return "unknown";
}

const char *toString(CompassDirection direction) {
  switch (direction) {
  case CompassDirection::EAST:
    return "east";
  case CompassDirection::SOUTH:
    return "south";
  case CompassDirection::WEST:
    return "west";
  case CompassDirection::NORTH:
    return "north";
  }
  return "unknown";
}

} // namespace GeometryClassifier
} // namespace AccessOverlay
