/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "navigation/AnnouncementComposer.hpp"
#include "core/Logger.hpp"
#include "navigation/GeometryClassifier.hpp"
#include "utils/TextUtils.hpp"
#include <array>
#include <cctype>
#include <format>
#include <stdexcept>

namespace AccessOverlay {
namespace AnnouncementComposer {

namespace {

constexpr const char *SENTENCE_SEPARATOR = ". ";
constexpr const char *GENERIC_TASK_NAME = "task";
constexpr const char *CLEANING_KEYWORD = "Vent";
constexpr const char *CLEANING_LABEL = "Vent Cleaning";
constexpr std::array<const char *, 4> NOISE_TOKENS{"Task", "Mini", "System", "(Clone)"};

std::string directionAndDistance(const PointOfInterest &poi,
                                 const Vector2D &playerPos) {
  Vector2D const offset = poi.object->worldPosition() - playerPos;
  return std::format("{}, {} meters",
                     GeometryClassifier::toString(GeometryClassifier::cardinalDirection(offset)),
                     GeometryClassifier::formatDistance(poi.distance));
}

} // namespace

std::string join(const std::vector<std::string> &sentences) {
  std::string result;
  for (const auto &sentence : sentences) {
    if (sentence.empty()) {
      continue;
    }
    if (!result.empty()) {
      result += SENTENCE_SEPARATOR;
    }
    result += sentence;
  }
  return result;
}

std::string roomEntry(const RoomId &room, const std::string &entryDirection) {
  if (entryDirection.empty()) {
    return std::format("Entered {}", room);
  }
  return std::format("Entered {} from the {}", room, entryDirection);
}

std::string roomPosition(const RoomId &room, const std::string &descriptor) {
  if (descriptor.empty()) {
    return std::format("In {}", room);
  }
  return std::format("In the {} {}", descriptor, room);
}

std::string pointOfInterest(const PointOfInterest &poi,
                            const Vector2D &playerPos) {
  std::string const name = displayName(*poi.object);
  if (poi.withinReach()) {
    return std::format("{} within reach", name);
  }
  return std::format("{} {}", name, directionAndDistance(poi, playerPos));
}

std::string noTasks(const RoomId &room) {
  return std::format("No tasks available in {}", room);
}

std::string roomAnnouncement(const RoomId &room, bool initialEntry,
                             const std::string &entryDirection,
                             const std::string &descriptor,
                             const std::vector<PointOfInterest> &pois,
                             const Vector2D &playerPos, bool announceEmpty) {
  std::vector<std::string> sentences;
  sentences.reserve(pois.size() + 1);

  sentences.push_back(initialEntry ? roomEntry(room, entryDirection)
                                   : roomPosition(room, descriptor));

  for (const auto &poi : pois) {
    if (poi.object) {
      sentences.push_back(pointOfInterest(poi, playerPos));
    }
  }

  if (pois.empty() && announceEmpty) {
    sentences.push_back(noTasks(room));
  }

  return join(sentences);
}

std::string nearestTask(const std::optional<PointOfInterest> &nearest,
                        const RoomId &room, const Vector2D &playerPos) {
  if (!nearest || !nearest->object) {
    return noTasks(room);
  }

  std::string const name = displayName(*nearest->object);
  if (nearest->withinReach()) {
    return std::format("At {}", name);
  }
  return std::format("{} {}", name, directionAndDistance(*nearest, playerPos));
}

std::string displayName(const IInteractiveObject &object) {
  try {
    std::string const rawName = object.objectName();
    if (rawName.find(CLEANING_KEYWORD) != std::string::npos) {
      return CLEANING_LABEL;
    }

    for (const auto &taskType : object.taskTypeNames()) {
      if (!taskType.empty() && taskType != "None") {
        std::string const name = sanitizeName(taskType);
        if (!name.empty()) {
          return name;
        }
      }
    }

    if (!rawName.empty()) {
      std::string const name = sanitizeName(rawName);
      if (!name.empty()) {
        return name;
      }
    }
  } catch (const std::exception &e) {
    NAVIGATION_ERROR(std::format("Error getting task name: {}", e.what()));
  } catch (...) {
    NAVIGATION_ERROR("Unknown error getting task name");
  }

  return GENERIC_TASK_NAME;
}

std::string sanitizeName(const std::string &raw) {
  std::string name = raw;
  for (const char *token : NOISE_TOKENS) {
    TextUtils::eraseAll(name, token);
  }

  // Walk backwards so earlier indices stay valid across insertions
  for (int i = static_cast<int>(name.size()) - 2; i >= 0; --i) {
    auto const next = static_cast<unsigned char>(name[i + 1]);
    auto const current = static_cast<unsigned char>(name[i]);
    if (std::isupper(next) && !std::isspace(current)) {
      name.insert(static_cast<size_t>(i + 1), 1, ' ');
    }
  }

  return TextUtils::trim(name);
}

std::string playerLeft(const std::optional<std::string> &playerName) {
  if (!playerName || playerName->empty()) {
    return "An unknown player left the game";
  }
  return std::format("{} left the game", *playerName);
}

std::string meetingStarted(const std::optional<std::string> &reporterColor) {
  if (!reporterColor || reporterColor->empty()) {
    return "Body reported, meeting started";
  }
  return std::format("Emergency meeting called by {}", *reporterColor);
}

std::string itemsAvailable(size_t count) {
  return std::format("{} items available.", count);
}

std::string positionSuffix(int index, size_t count) {
  if (index < 0 || static_cast<size_t>(index) >= count) {
    return "";
  }
  return std::format(" {} of {}", index + 1, count);
}

} // namespace AnnouncementComposer
} // namespace AccessOverlay
