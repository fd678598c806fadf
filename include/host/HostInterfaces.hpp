/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HOST_INTERFACES_HPP
#define HOST_INTERFACES_HPP

#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace AccessOverlay {

/**
 * @brief Capability interfaces the host game implements over its own objects.
 *
 * The overlay never sees host concrete types. Adapters living in the host
 * plugin wrap engine objects behind these interfaces; every object is
 * host-owned and may disappear between two ticks, so accessors that return
 * pointers may hand back null and callers treat that as "absent".
 */

// A named area of the map (a room). Read-only from the overlay's side.
class IRoomArea {
public:
  virtual ~IRoomArea() = default;

  // Host enum-like room name, e.g. "ElectricalSystem"
  virtual std::string rawName() const = 0;
  virtual bool containsPoint(const Vector2D &point) const = 0;
  virtual AABB bounds() const = 0;
};

enum class TaskState : uint8_t {
  NO_TASK,    // object has no task assigned to the local player
  INCOMPLETE,
  COMPLETE
};

// An interactive console or task station
class IInteractiveObject {
public:
  virtual ~IInteractiveObject() = default;

  virtual std::string objectName() const = 0;
  // Declared task type names in declaration order; "None" marks an unset slot
  virtual std::vector<std::string> taskTypeNames() const = 0;
  virtual Vector2D worldPosition() const = 0;
  // Interaction range; the player is "within reach" inside it
  virtual float usableDistance() const = 0;
  // Object can only be used while the player stands below it
  virtual bool onlyFromBelow() const = 0;
  virtual TaskState taskState() const = 0;
  // Host predicate: the object is usable for the local player's task context
  virtual bool isValidForCurrentTask() const = 0;
};

using InteractiveObjectPtr = std::shared_ptr<const IInteractiveObject>;

// The map the local player is walking through
class IShipWorld {
public:
  virtual ~IShipWorld() = default;

  // False while the host has no map loaded (lobby, menus)
  virtual bool isAvailable() const = 0;
  // Host iteration order; the first containing room wins
  virtual std::vector<const IRoomArea *> roomAreas() const = 0;
  virtual std::vector<InteractiveObjectPtr> interactiveObjects() const = 0;
};

struct RaycastHit {
  Vector2D point;
  float distance{0.0f};
};

// Host physics raycast against a collision layer mask
class IRaycaster {
public:
  virtual ~IRaycaster() = default;

  virtual std::optional<RaycastHit> raycast(const Vector2D &origin,
                                            const Vector2D &direction,
                                            float maxDistance,
                                            uint32_t layerMask) const = 0;
};

// One selectable element of the host's current UI state
class IUIElement {
public:
  virtual ~IUIElement() = default;

  // Stable identity of the underlying host object
  virtual int instanceId() const = 0;
  virtual Vector2D position() const = 0;
  virtual bool isActiveAndEnabled() const = 0;
  // Button-like elements can be clicked through the host
  virtual bool isClickable() const = 0;

  virtual std::optional<std::string> primaryLabel() const = 0;
  virtual std::optional<std::string> secondaryLabel() const = 0;
  virtual std::string objectName() const = 0;
  // Text of a named child label, if the element has one
  virtual std::optional<std::string>
  childText(const std::string &childName) const = 0;
};

using UIElementPtr = std::shared_ptr<const IUIElement>;

// The host's UI controller
class IUIHost {
public:
  virtual ~IUIHost() = default;

  virtual bool isUiControllerActive() const = 0;
  virtual std::string activeSceneName() const = 0;
  virtual std::vector<UIElementPtr> selectableElements() const = 0;
  virtual UIElementPtr currentSelection() const = 0;

  virtual void setSelection(const UIElementPtr &element) = 0;
  // Issues a click-down followed by a click-up on the element
  virtual void invokeClick(const UIElementPtr &element) = 0;
};

} // namespace AccessOverlay

#endif // HOST_INTERFACES_HPP
