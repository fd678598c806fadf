/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/RoomTracker.hpp"
#include "core/Logger.hpp"
#include "navigation/GeometryClassifier.hpp"
#include "utils/TextUtils.hpp"
#include <format>

namespace AccessOverlay {

namespace {

constexpr const char *ROOM_SUFFIX_TOKEN = "System";

} // namespace

RoomId normalizeRoomId(const std::string &rawName) {
  std::string name = rawName;
  TextUtils::eraseAll(name, ROOM_SUFFIX_TOKEN);
  return TextUtils::trim(name);
}

bool roomIdsEqual(const RoomId &a, const RoomId &b) {
  return TextUtils::equalsIgnoreCase(a, b);
}

bool isHallway(const RoomId &room) { return roomIdsEqual(room, HALLWAY_ROOM); }

const IRoomArea *findRoomAt(const IShipWorld &world, const Vector2D &point) {
  for (const IRoomArea *room : world.roomAreas()) {
    if (room != nullptr && room->containsPoint(point)) {
      return room;
    }
  }
  return nullptr;
}

RoomId roomIdAt(const IShipWorld &world, const Vector2D &point) {
  const IRoomArea *room = findRoomAt(world, point);
  return room != nullptr ? normalizeRoomId(room->rawName()) : RoomId(HALLWAY_ROOM);
}

std::optional<RoomChangeEvent> RoomTracker::update(const Vector2D &position,
                                                   const IShipWorld &world) {
  RoomId const newRoom = roomIdAt(world, position);

  // currentRoom starts empty so the very first tick always transitions
  if (!m_state.currentRoom.empty() && roomIdsEqual(newRoom, m_state.currentRoom)) {
    return std::nullopt;
  }

  std::string direction;
  if (m_state.lastEntrancePos.has_value()) {
    Vector2D const movement = *m_state.lastEntrancePos - position;
    if (!movement.isNearlyZero()) {
      direction = GeometryClassifier::toString(GeometryClassifier::entryDirection(movement));
    }
  }

  NAVIGATION_DEBUG(std::format("Room change: '{}' -> '{}'", m_state.currentRoom, newRoom));

  m_state.currentRoom = newRoom;
  m_state.lastEntrancePos = position;
  m_state.isInitialEntry = true;

  return RoomChangeEvent{newRoom, direction};
}

} // namespace AccessOverlay
