/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POINT_OF_INTEREST_LOCATOR_HPP
#define POINT_OF_INTEREST_LOCATOR_HPP

#include "host/HostInterfaces.hpp"
#include "navigation/RoomTracker.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace AccessOverlay {

class VisibilityProbe;

// How line of sight affects query results for a deployment
enum class VisibilityPolicy : uint8_t {
  HARD_FILTER, // objects that fail the probe are dropped
  ADVISORY     // objects are kept and only flagged
};

struct PointOfInterest {
  InteractiveObjectPtr object;
  float distance{0.0f};
  float usableDistance{0.0f};
  bool isVisible{true};

  bool withinReach() const { return distance <= usableDistance; }
};

/**
 * @brief Enumerates the host's interactive objects that matter right now.
 *
 * Holds no state between calls; every query re-reads the host world.
 */
class PointOfInterestLocator {
public:
  PointOfInterestLocator(const IShipWorld &world, const VisibilityProbe &probe,
                         VisibilityPolicy policy = VisibilityPolicy::HARD_FILTER)
      : m_world(world), m_probe(probe), m_policy(policy) {}

  /**
   * @brief Objects with an open task in the player's room
   * @return Ascending by distance; always empty in the hallway
   */
  std::vector<PointOfInterest> query(const Vector2D &playerPos,
                                     const RoomId &currentRoom) const;

  // Closest entry of query(), if any
  std::optional<PointOfInterest> nearest(const Vector2D &playerPos,
                                         const RoomId &currentRoom) const;

  VisibilityPolicy policy() const { return m_policy; }
  void setPolicy(VisibilityPolicy policy) { m_policy = policy; }

private:
  const IShipWorld &m_world;
  const VisibilityProbe &m_probe;
  VisibilityPolicy m_policy;
};

} // namespace AccessOverlay

#endif // POINT_OF_INTEREST_LOCATOR_HPP
