/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_HANDLER_HPP
#define NAVIGATION_HANDLER_HPP

#include "host/HostInterfaces.hpp"
#include "navigation/PointOfInterestLocator.hpp"
#include "navigation/RoomTracker.hpp"
#include "navigation/VisibilityProbe.hpp"
#include <cstdint>
#include <optional>

namespace AccessOverlay {

class AnnouncementSink;

struct PlayerTickInput {
  uint32_t playerId{0};
  Vector2D position{};
  // Only the locally controlled player drives announcements
  bool isLocalOwner{false};
};

struct NavigationOptions {
  float visibilityBuffer{VisibilityProbe::DEFAULT_BUFFER};
  uint32_t blockingMask{0xFFFFFFFFu};
  VisibilityPolicy visibilityPolicy{VisibilityPolicy::HARD_FILTER};
};

/**
 * @brief Room and task announcements for the local player.
 *
 * Runs the room tracker every player tick and speaks on room changes.
 * scanSurroundings() and findNearestTask() answer explicit key requests
 * using the position seen on the most recent tick.
 */
class NavigationHandler {
public:
  NavigationHandler(const IShipWorld &world, const IRaycaster &raycaster,
                    AnnouncementSink &sink,
                    const NavigationOptions &options = NavigationOptions{});

  NavigationHandler(const NavigationHandler &) = delete;
  NavigationHandler &operator=(const NavigationHandler &) = delete;

  void onPlayerTick(const PlayerTickInput &input);

  // "In the top left of the Electrical. ..." style position update
  void scanSurroundings();
  void findNearestTask();

  void setVisibilityPolicy(VisibilityPolicy policy) { m_locator.setPolicy(policy); }
  // Takes effect from the next query; room state is kept
  void applyOptions(const NavigationOptions &options);

  const RoomTracker &roomTracker() const { return m_roomTracker; }
  const PointOfInterestLocator &locator() const { return m_locator; }
  const std::optional<Vector2D> &lastPosition() const { return m_lastPosition; }

private:
  void announceRoom(const Vector2D &position, const std::string &entryDirection,
                    bool announceEmpty);

  const IShipWorld &m_world;
  AnnouncementSink &m_sink;
  VisibilityProbe m_probe;
  PointOfInterestLocator m_locator;
  RoomTracker m_roomTracker{};
  std::optional<Vector2D> m_lastPosition{};
};

} // namespace AccessOverlay

#endif // NAVIGATION_HANDLER_HPP
