/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/NavigationHandler.hpp"
#include "core/Logger.hpp"
#include "navigation/AnnouncementComposer.hpp"
#include "navigation/GeometryClassifier.hpp"
#include "speech/AnnouncementSink.hpp"
#include <format>
#include <stdexcept>

namespace AccessOverlay {

NavigationHandler::NavigationHandler(const IShipWorld &world,
                                     const IRaycaster &raycaster,
                                     AnnouncementSink &sink,
                                     const NavigationOptions &options)
    : m_world(world), m_sink(sink),
      m_probe(raycaster, options.blockingMask, options.visibilityBuffer),
      m_locator(world, m_probe, options.visibilityPolicy) {}

void NavigationHandler::applyOptions(const NavigationOptions &options) {
  m_probe.setBuffer(options.visibilityBuffer);
  m_probe.setBlockingMask(options.blockingMask);
  m_locator.setPolicy(options.visibilityPolicy);
}

void NavigationHandler::onPlayerTick(const PlayerTickInput &input) {
  if (!input.isLocalOwner) {
    return;
  }

  try {
    if (!m_world.isAvailable()) {
      return;
    }

    m_lastPosition = input.position;

    auto const change = m_roomTracker.update(input.position, m_world);
    if (change) {
      announceRoom(input.position, change->entryDirection, false);
    }
  } catch (const std::exception &e) {
    NAVIGATION_ERROR(std::format("Error in navigation update: {}", e.what()));
  } catch (...) {
    NAVIGATION_ERROR("Unknown error in navigation update");
  }
}

void NavigationHandler::scanSurroundings() {
  try {
    if (!m_lastPosition || !m_world.isAvailable() ||
        m_roomTracker.currentRoom().empty()) {
      NAVIGATION_DEBUG("Scan requested before the first player tick");
      return;
    }

    m_roomTracker.markAnnounced();
    announceRoom(*m_lastPosition, "", true);
  } catch (const std::exception &e) {
    NAVIGATION_ERROR(std::format("Error scanning surroundings: {}", e.what()));
  } catch (...) {
    NAVIGATION_ERROR("Unknown error scanning surroundings");
  }
}

void NavigationHandler::findNearestTask() {
  try {
    if (!m_lastPosition || !m_world.isAvailable() ||
        m_roomTracker.currentRoom().empty()) {
      return;
    }

    const RoomId &room = m_roomTracker.currentRoom();
    auto const nearest = m_locator.nearest(*m_lastPosition, room);
    m_sink.speak(AnnouncementComposer::nearestTask(nearest, room, *m_lastPosition));
  } catch (const std::exception &e) {
    NAVIGATION_ERROR(std::format("Error finding nearest task: {}", e.what()));
  } catch (...) {
    NAVIGATION_ERROR("Unknown error finding nearest task");
  }
}

void NavigationHandler::announceRoom(const Vector2D &position,
                                     const std::string &entryDirection,
                                     bool announceEmpty) {
  const RoomId &room = m_roomTracker.currentRoom();

  std::string descriptor;
  if (const IRoomArea *area = findRoomAt(m_world, position)) {
    descriptor = GeometryClassifier::roomRelativePosition(position, area->bounds());
  }

  auto const pois = m_locator.query(position, room);
  bool const hallway = isHallway(room);
  std::string const text = AnnouncementComposer::roomAnnouncement(
      room, m_roomTracker.isInitialEntry(), entryDirection, descriptor, pois,
      position, announceEmpty && !hallway);

  m_roomTracker.markAnnounced();
  m_sink.speak(text);
}

} // namespace AccessOverlay
