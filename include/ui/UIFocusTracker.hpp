/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UI_FOCUS_TRACKER_HPP
#define UI_FOCUS_TRACKER_HPP

#include "host/HostInterfaces.hpp"
#include "ui/UIElementOrderer.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace AccessOverlay {

class AnnouncementSink;
class MenuLayoutRegistry;
struct MenuLayoutConfig;

enum class UICommand : uint8_t {
  NEXT_ELEMENT,
  PREVIOUS_ELEMENT,
  ACTIVATE_ELEMENT
};

/**
 * @brief Follows the host's selectable elements and focused element.
 *
 * Each UI tick re-reads the element list. A changed element set is
 * announced with its size and the first element gets focus. Focus moves
 * made by the host (mouse, controller) are announced on the tick that
 * sees them. The element list is re-read fresh on every tick and never
 * cached across screens.
 */
class UIFocusTracker {
public:
  UIFocusTracker(AnnouncementSink &sink, const MenuLayoutRegistry &registry,
                 float verticalThreshold = UIElementOrderer::DEFAULT_VERTICAL_THRESHOLD);

  UIFocusTracker(const UIFocusTracker &) = delete;
  UIFocusTracker &operator=(const UIFocusTracker &) = delete;

  void onTick(IUIHost &host);
  void handleCommand(UICommand command, IUIHost &host);

  // Elements in reading order as of the last tick
  const std::vector<UIElementPtr> &currentElements() const { return m_latestOrder; }
  bool isBusy() const { return m_busy; }
  void setVerticalThreshold(float threshold) { m_orderer = UIElementOrderer(threshold); }

private:
  class BusyGuard;

  void refreshElements(IUIHost &host, const MenuLayoutConfig *config);
  void checkFocus(IUIHost &host, const MenuLayoutConfig *config);
  void focusElement(const UIElementPtr &element, const MenuLayoutConfig *config);
  std::string announcementFor(const IUIElement &element,
                              const MenuLayoutConfig *config) const;
  void runAction(const IUIElement &element, const MenuLayoutConfig *config) const;
  void moveSelection(int step, IUIHost &host);
  int indexOf(int instanceId) const;

  AnnouncementSink &m_sink;
  const MenuLayoutRegistry &m_registry;
  UIElementOrderer m_orderer;

  std::vector<UIElementPtr> m_latestOrder{};
  std::set<int> m_elementIds{};
  std::optional<int> m_lastFocusedId{};
  bool m_busy{false};
};

} // namespace AccessOverlay

#endif // UI_FOCUS_TRACKER_HPP
