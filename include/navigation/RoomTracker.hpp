/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROOM_TRACKER_HPP
#define ROOM_TRACKER_HPP

#include "host/HostInterfaces.hpp"
#include <optional>
#include <string>

namespace AccessOverlay {

using RoomId = std::string;

// Reserved room identity for "not inside any recognized room"
inline constexpr const char *HALLWAY_ROOM = "hallway";

// Strips the host's "System" suffix token and surrounding whitespace
RoomId normalizeRoomId(const std::string &rawName);
bool roomIdsEqual(const RoomId &a, const RoomId &b);
bool isHallway(const RoomId &room);

// First room containing the point in host iteration order, or null
const IRoomArea *findRoomAt(const IShipWorld &world, const Vector2D &point);
// Normalised id of the room containing the point, hallway when none
RoomId roomIdAt(const IShipWorld &world, const Vector2D &point);

struct PlayerNavState {
  RoomId currentRoom{};
  std::optional<Vector2D> lastEntrancePos{};
  bool isInitialEntry{true};
};

struct RoomChangeEvent {
  RoomId room;
  // Empty when no previous entrance was recorded
  std::string entryDirection;
};

/**
 * @brief Per-player room state machine.
 *
 * States are room identities including the hallway sentinel. A transition
 * fires whenever the room containing the player differs from the stored
 * room; the stored room is only ever written by update().
 */
class RoomTracker {
public:
  /**
   * @brief Re-evaluates the player's room for this tick
   * @param position Player position this tick
   * @param world Current room geometry
   * @return The room-change event, or nullopt when the room is unchanged
   */
  std::optional<RoomChangeEvent> update(const Vector2D &position,
                                        const IShipWorld &world);

  const PlayerNavState &state() const { return m_state; }
  const RoomId &currentRoom() const { return m_state.currentRoom; }
  bool isInitialEntry() const { return m_state.isInitialEntry; }

  // The entry phrasing has been spoken, or the player asked for a scan
  void markAnnounced() { m_state.isInitialEntry = false; }

  void reset() { m_state = PlayerNavState{}; }

private:
  PlayerNavState m_state{};
};

} // namespace AccessOverlay

#endif // ROOM_TRACKER_HPP
