/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/AccessibilityOverlay.hpp"
#include "core/Logger.hpp"
#include "navigation/AnnouncementComposer.hpp"
#include "utils/TextUtils.hpp"
#include <format>
#include <stdexcept>
#include <utility>

namespace AccessOverlay {

namespace {

constexpr const char *LOADED_MESSAGE = "Access overlay loaded";

} // namespace

VisibilityPolicy parseVisibilityPolicy(const std::string &value) {
  if (TextUtils::equalsIgnoreCase(TextUtils::trim(value), "advisory")) {
    return VisibilityPolicy::ADVISORY;
  }
  if (!TextUtils::equalsIgnoreCase(TextUtils::trim(value), "filter")) {
    SETTINGS_WARNING(std::format("Unknown visibility policy '{}', using filter", value));
  }
  return VisibilityPolicy::HARD_FILTER;
}

AccessibilityOverlay::AccessibilityOverlay(ISpeechSink &speech,
                                           const IShipWorld &world,
                                           const IRaycaster &raycaster)
    : m_sink(speech), m_navigation(world, raycaster, m_sink),
      m_uiFocus(m_sink, m_menus) {
  m_settings.applyDefaults();
}

AccessibilityOverlay::~AccessibilityOverlay() {
  for (size_t const id : m_listenerIds) {
    m_settings.unregisterChangeListener(id);
  }
}

bool AccessibilityOverlay::initialize() {
  if (m_initialized) {
    OVERLAY_WARN("Overlay already initialized");
    return false;
  }

  try {
    // Host may have changed settings between construction and now
    m_navigation.applyOptions(navigationOptions());
    m_uiFocus.setVerticalThreshold(m_settings.get<float>(
        SettingKeys::UI, SettingKeys::VERTICAL_THRESHOLD,
        UIElementOrderer::DEFAULT_VERTICAL_THRESHOLD));
    m_keyBindings.loadFrom(m_settings);

    m_listenerIds.push_back(m_settings.registerChangeListener(
        "", [this](const std::string &category, const std::string &key,
                   const AccessSettings::SettingValue &) { onSettingChanged(category, key); }));

    configureDefaultMenus(m_menus);
  } catch (const std::exception &e) {
    OVERLAY_CRITICAL(std::format("Overlay initialization failed: {}", e.what()));
    return false;
  } catch (...) {
    OVERLAY_CRITICAL("Overlay initialization failed with an unknown exception");
    return false;
  }

  m_initialized = true;
  OVERLAY_INFO("Access overlay initialized");
  m_sink.speak(LOADED_MESSAGE);
  return true;
}

void AccessibilityOverlay::onPlayerTick(const PlayerTickInput &input) {
  m_navigation.onPlayerTick(input);
}

void AccessibilityOverlay::onUITick(IUIHost &host) {
  try {
    m_uiFocus.onTick(host);
  } catch (const std::exception &e) {
    OVERLAY_ERROR(std::format("Error in UI update: {}", e.what()));
  } catch (...) {
    OVERLAY_ERROR("Unknown error in UI update");
  }
}

bool AccessibilityOverlay::handleEvent(const SDL_Event &event, IUIHost &host) {
  AccessCommand const command = m_keyBindings.translate(event);
  if (command == AccessCommand::NONE) {
    return false;
  }
  runCommand(command, host);
  return true;
}

void AccessibilityOverlay::runCommand(AccessCommand command, IUIHost &host) {
  OVERLAY_DEBUG(std::format("Command: {}", toString(command)));
  try {
    switch (command) {
    case AccessCommand::NEXT_ELEMENT:
      m_uiFocus.handleCommand(UICommand::NEXT_ELEMENT, host);
      break;
    case AccessCommand::PREVIOUS_ELEMENT:
      m_uiFocus.handleCommand(UICommand::PREVIOUS_ELEMENT, host);
      break;
    case AccessCommand::ACTIVATE_ELEMENT:
      m_uiFocus.handleCommand(UICommand::ACTIVATE_ELEMENT, host);
      break;
    case AccessCommand::SCAN_SURROUNDINGS:
      m_navigation.scanSurroundings();
      break;
    case AccessCommand::FIND_NEAREST_TASK:
      m_navigation.findNearestTask();
      break;
    case AccessCommand::NONE:
      break;
    }
  } catch (const std::exception &e) {
    OVERLAY_ERROR(std::format("Error running '{}': {}", toString(command), e.what()));
  } catch (...) {
    OVERLAY_ERROR(std::format("Unknown error running '{}'", toString(command)));
  }
}

void AccessibilityOverlay::setMenuConfig(const std::string &sceneName,
                                         MenuLayoutConfig config) {
  m_menus.setMenuConfig(sceneName, std::move(config));
}

void AccessibilityOverlay::onPlayerLeft(const std::optional<std::string> &playerName) {
  try {
    m_sink.speak(AnnouncementComposer::playerLeft(playerName));
  } catch (const std::exception &e) {
    OVERLAY_ERROR(std::format("Error in player left announcement: {}", e.what()));
  } catch (...) {
    OVERLAY_ERROR("Unknown error in player left announcement");
  }
}

void AccessibilityOverlay::onMeetingStarted(const std::optional<std::string> &reporterColor) {
  try {
    m_sink.speak(AnnouncementComposer::meetingStarted(reporterColor));
  } catch (const std::exception &e) {
    OVERLAY_ERROR(std::format("Error in meeting announcement: {}", e.what()));
  } catch (...) {
    OVERLAY_ERROR("Unknown error in meeting announcement");
  }
}

void AccessibilityOverlay::onExileText(const std::string &text) {
  m_sink.speak(text);
}

NavigationOptions AccessibilityOverlay::navigationOptions() const {
  NavigationOptions options;
  options.visibilityBuffer = m_settings.get<float>(
      SettingKeys::NAVIGATION, SettingKeys::VISIBILITY_BUFFER, VisibilityProbe::DEFAULT_BUFFER);
  options.blockingMask = static_cast<uint32_t>(
      m_settings.get<int>(SettingKeys::NAVIGATION, SettingKeys::BLOCKING_MASK, -1));
  options.visibilityPolicy = parseVisibilityPolicy(m_settings.get<std::string>(
      SettingKeys::NAVIGATION, SettingKeys::VISIBILITY_POLICY, "filter"));
  return options;
}

void AccessibilityOverlay::onSettingChanged(const std::string &category,
                                            const std::string &key) {
  if (category == SettingKeys::NAVIGATION) {
    m_navigation.applyOptions(navigationOptions());
  } else if (category == SettingKeys::UI) {
    m_uiFocus.setVerticalThreshold(m_settings.get<float>(
        SettingKeys::UI, SettingKeys::VERTICAL_THRESHOLD,
        UIElementOrderer::DEFAULT_VERTICAL_THRESHOLD));
  } else if (category == SettingKeys::CONTROLS) {
    // Rebind the changed control only; other entries may still name a moved key
    m_keyBindings.loadBinding(m_settings, key);
  }
}

} // namespace AccessOverlay
