/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/UIFocusTracker.hpp"
#include "core/Logger.hpp"
#include "navigation/AnnouncementComposer.hpp"
#include "speech/AnnouncementSink.hpp"
#include "ui/MenuLayoutConfig.hpp"
#include <format>
#include <memory>
#include <stdexcept>
#include <utility>

namespace AccessOverlay {

// Holds the busy flag for one UI pass; re-entrant passes see it and return
class UIFocusTracker::BusyGuard {
public:
  explicit BusyGuard(bool &flag) : m_flag(flag) { m_flag = true; }
  ~BusyGuard() { m_flag = false; }

  BusyGuard(const BusyGuard &) = delete;
  BusyGuard &operator=(const BusyGuard &) = delete;

private:
  bool &m_flag;
};

UIFocusTracker::UIFocusTracker(AnnouncementSink &sink,
                               const MenuLayoutRegistry &registry,
                               float verticalThreshold)
    : m_sink(sink), m_registry(registry), m_orderer(verticalThreshold) {}

void UIFocusTracker::onTick(IUIHost &host) {
  if (m_busy || !host.isUiControllerActive()) {
    return;
  }

  BusyGuard guard(m_busy);
  try {
    // Keep the config alive for the whole pass even if the scene is re-registered
    std::shared_ptr<const MenuLayoutConfig> const config =
        m_registry.find(host.activeSceneName());
    refreshElements(host, config.get());
    // A selection left over from an emptied screen is not announced
    if (!m_latestOrder.empty()) {
      checkFocus(host, config.get());
    }
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Error in screen reader update: {}", e.what()));
  } catch (...) {
    UI_ACCESS_ERROR("Unknown error in screen reader update");
  }
}

void UIFocusTracker::handleCommand(UICommand command, IUIHost &host) {
  if (m_busy || !host.isUiControllerActive()) {
    return;
  }

  BusyGuard guard(m_busy);
  try {
    switch (command) {
    case UICommand::NEXT_ELEMENT:
      moveSelection(1, host);
      break;
    case UICommand::PREVIOUS_ELEMENT:
      moveSelection(-1, host);
      break;
    case UICommand::ACTIVATE_ELEMENT: {
      UIElementPtr const selection = host.currentSelection();
      if (selection && selection->isClickable()) {
        UI_ACCESS_DEBUG(std::format("Activating '{}'", elementDisplayName(*selection)));
        host.invokeClick(selection);
      }
      break;
    }
    }
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Error in keyboard navigation: {}", e.what()));
  } catch (...) {
    UI_ACCESS_ERROR("Unknown error in keyboard navigation");
  }
}

void UIFocusTracker::refreshElements(IUIHost &host, const MenuLayoutConfig *config) {
  std::vector<UIElementPtr> sorted = m_orderer.sort(host.selectableElements(), config);

  std::set<int> ids;
  for (const auto &element : sorted) {
    ids.insert(element->instanceId());
  }

  m_latestOrder = std::move(sorted);
  if (ids == m_elementIds) {
    return;
  }
  m_elementIds = std::move(ids);

  UI_ACCESS_INFO(std::format("UI elements changed: {} elements", m_latestOrder.size()));
  for (const auto &element : m_latestOrder) {
    UI_ACCESS_DEBUG(std::format("  - {}", elementDisplayName(*element)));
  }

  m_sink.speak(AnnouncementComposer::itemsAvailable(m_latestOrder.size()));

  if (m_latestOrder.empty()) {
    m_lastFocusedId.reset();
    return;
  }

  UIElementPtr const first = m_latestOrder.front();
  host.setSelection(first);
  focusElement(first, config);
}

void UIFocusTracker::checkFocus(IUIHost &host, const MenuLayoutConfig *config) {
  UIElementPtr const selection = host.currentSelection();
  if (!selection) {
    return;
  }
  if (m_lastFocusedId && *m_lastFocusedId == selection->instanceId()) {
    return;
  }
  focusElement(selection, config);
}

void UIFocusTracker::focusElement(const UIElementPtr &element,
                                  const MenuLayoutConfig *config) {
  m_sink.speak(announcementFor(*element, config));
  runAction(*element, config);
  m_lastFocusedId = element->instanceId();
}

std::string UIFocusTracker::announcementFor(const IUIElement &element,
                                            const MenuLayoutConfig *config) const {
  std::string text;
  if (config != nullptr) {
    if (const SpeechProvider *provider = config->speechProviderFor(element)) {
      try {
        text = (*provider)(element);
      } catch (const std::exception &e) {
        UI_ACCESS_ERROR(std::format("Custom speech provider failed: {}", e.what()));
      } catch (...) {
        UI_ACCESS_ERROR("Custom speech provider failed with an unknown exception");
      }
    }
    if (text.empty()) {
      if (const std::string *custom = config->speechTextFor(element)) {
        text = *custom;
      }
    }
  }
  if (text.empty()) {
    text = elementDisplayName(element);
  }

  return text + AnnouncementComposer::positionSuffix(indexOf(element.instanceId()),
                                                     m_latestOrder.size());
}

void UIFocusTracker::runAction(const IUIElement &element,
                               const MenuLayoutConfig *config) const {
  if (config == nullptr) {
    return;
  }
  const ActionHandler *action = config->actionFor(element);
  if (action == nullptr) {
    return;
  }
  try {
    (*action)(element);
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Focus action for '{}' failed: {}",
                                elementDisplayName(element), e.what()));
  } catch (...) {
    UI_ACCESS_ERROR(std::format("Focus action for '{}' failed with an unknown exception",
                                elementDisplayName(element)));
  }
}

void UIFocusTracker::moveSelection(int step, IUIHost &host) {
  std::shared_ptr<const MenuLayoutConfig> const config =
      m_registry.find(host.activeSceneName());
  m_latestOrder = m_orderer.sort(host.selectableElements(), config.get());
  if (m_latestOrder.empty()) {
    return;
  }

  UIElementPtr const selection = host.currentSelection();
  int const current = selection ? indexOf(selection->instanceId()) : -1;
  int const target = current + step;
  // No wrap-around; an unknown selection moves to the first element on "next"
  if (target < 0 || target >= static_cast<int>(m_latestOrder.size())) {
    return;
  }
  host.setSelection(m_latestOrder[static_cast<size_t>(target)]);
}

int UIFocusTracker::indexOf(int instanceId) const {
  for (size_t i = 0; i < m_latestOrder.size(); ++i) {
    if (m_latestOrder[i]->instanceId() == instanceId) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

} // namespace AccessOverlay
