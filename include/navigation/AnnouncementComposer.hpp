/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANNOUNCEMENT_COMPOSER_HPP
#define ANNOUNCEMENT_COMPOSER_HPP

#include "host/HostInterfaces.hpp"
#include "navigation/PointOfInterestLocator.hpp"
#include "navigation/RoomTracker.hpp"
#include <optional>
#include <string>
#include <vector>

namespace AccessOverlay {

/**
 * @brief Turns precomputed navigation facts into speech strings.
 *
 * Pure string assembly; nothing here queries the host beyond reading the
 * object passed in. Sentences of one announcement are joined with ". ".
 */
namespace AnnouncementComposer {

std::string join(const std::vector<std::string> &sentences);

// "Entered {room}" / "Entered {room} from the {direction}"
std::string roomEntry(const RoomId &room, const std::string &entryDirection);

// "In the {descriptor} {room}" / "In {room}"
std::string roomPosition(const RoomId &room, const std::string &descriptor);

// "{name} within reach" / "{name} {direction}, {distance} meters"
std::string pointOfInterest(const PointOfInterest &poi,
                            const Vector2D &playerPos);

std::string noTasks(const RoomId &room);

/**
 * @brief Full announcement for a room change or a position scan
 * @param initialEntry Use the "Entered" phrasing instead of the position one
 * @param descriptor Positional descriptor, empty when unknown
 * @param announceEmpty Append the no-tasks sentence when pois is empty
 */
std::string roomAnnouncement(const RoomId &room, bool initialEntry,
                             const std::string &entryDirection,
                             const std::string &descriptor,
                             const std::vector<PointOfInterest> &pois,
                             const Vector2D &playerPos, bool announceEmpty);

// "At {name}" / "{name} {direction}, {distance} meters" / no-tasks sentence
std::string nearestTask(const std::optional<PointOfInterest> &nearest,
                        const RoomId &room, const Vector2D &playerPos);

/**
 * @brief Spoken name of an interactive object
 *
 * Cleaning stations get a fixed label, then the first declared task type,
 * then the object name. Any failure while reading the host object yields
 * the generic "task".
 */
std::string displayName(const IInteractiveObject &object);

// Strips noise tokens and splits concatenated words ("FixWiring" -> "Fix Wiring")
std::string sanitizeName(const std::string &raw);

// Game event phrasing
std::string playerLeft(const std::optional<std::string> &playerName);
std::string meetingStarted(const std::optional<std::string> &reporterColor);
std::string itemsAvailable(size_t count);
// " N of M", empty when index is out of range
std::string positionSuffix(int index, size_t count);

} // namespace AnnouncementComposer

} // namespace AccessOverlay

#endif // ANNOUNCEMENT_COMPOSER_HPP
