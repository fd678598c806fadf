/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/PointOfInterestLocator.hpp"
#include "core/Logger.hpp"
#include "navigation/VisibilityProbe.hpp"
#include <algorithm>
#include <format>

namespace AccessOverlay {

std::vector<PointOfInterest>
PointOfInterestLocator::query(const Vector2D &playerPos,
                              const RoomId &currentRoom) const {
  std::vector<PointOfInterest> result;

  // Tasks are never surfaced while walking corridors
  if (currentRoom.empty() || isHallway(currentRoom)) {
    return result;
  }

  for (const auto &object : m_world.interactiveObjects()) {
    if (!object) {
      continue;
    }

    Vector2D const objectPos = object->worldPosition();
    if (!roomIdsEqual(roomIdAt(m_world, objectPos), currentRoom)) {
      continue;
    }

    if (object->taskState() != TaskState::INCOMPLETE ||
        !object->isValidForCurrentTask()) {
      continue;
    }

    if (object->onlyFromBelow() && playerPos.getY() > objectPos.getY()) {
      continue;
    }

    bool const visible = m_probe.isVisible(playerPos, objectPos);
    if (!visible && m_policy == VisibilityPolicy::HARD_FILTER) {
      NAVIGATION_DEBUG(std::format("Skipping hidden object '{}'", object->objectName()));
      continue;
    }

    result.push_back(PointOfInterest{object,
                                     Vector2D::distance(playerPos, objectPos),
                                     object->usableDistance(), visible});
  }

  // Name breaks distance ties so equal inputs always produce equal output
  std::sort(result.begin(), result.end(),
            [](const PointOfInterest &a, const PointOfInterest &b) {
              if (a.distance != b.distance) {
                return a.distance < b.distance;
              }
              return a.object->objectName() < b.object->objectName();
            });

  return result;
}

std::optional<PointOfInterest>
PointOfInterestLocator::nearest(const Vector2D &playerPos,
                                const RoomId &currentRoom) const {
  auto const candidates = query(playerPos, currentRoom);
  if (candidates.empty()) {
    return std::nullopt;
  }
  return candidates.front();
}

} // namespace AccessOverlay
