/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACCESSIBILITY_OVERLAY_HPP
#define ACCESSIBILITY_OVERLAY_HPP

#include "host/HostInterfaces.hpp"
#include "input/KeyBindings.hpp"
#include "managers/AccessSettings.hpp"
#include "navigation/NavigationHandler.hpp"
#include "speech/AnnouncementSink.hpp"
#include "ui/MenuLayoutConfig.hpp"
#include "ui/UIFocusTracker.hpp"
#include <SDL3/SDL.h>
#include <optional>
#include <string>
#include <vector>

namespace AccessOverlay {

/**
 * @brief Entry point the host plugin talks to.
 *
 * Owns every overlay component and routes host callbacks to them. The
 * host forwards its player ticks, UI ticks, keyboard events and game
 * events; nothing is ever thrown back into the host.
 *
 * Usage:
 *   AccessibilityOverlay overlay(screenReader, shipWorld, physics);
 *   overlay.settings().set("navigation", "visibility_policy", "advisory");
 *   overlay.initialize();
 *   ...
 *   overlay.onPlayerTick({playerId, position, isLocal});
 *   overlay.handleEvent(event, uiHost);
 *   overlay.onUITick(uiHost);
 */
class AccessibilityOverlay {
public:
  AccessibilityOverlay(ISpeechSink &speech, const IShipWorld &world,
                       const IRaycaster &raycaster);
  ~AccessibilityOverlay();

  AccessibilityOverlay(const AccessibilityOverlay &) = delete;
  AccessibilityOverlay &operator=(const AccessibilityOverlay &) = delete;

  /**
   * @brief Registers the stock menu layouts and starts following settings
   * @return false if already initialized
   */
  bool initialize();
  bool isInitialized() const { return m_initialized; }

  void onPlayerTick(const PlayerTickInput &input);
  void onUITick(IUIHost &host);

  /**
   * @brief Runs the command bound to a key press
   * @return true when the event was an overlay command
   */
  bool handleEvent(const SDL_Event &event, IUIHost &host);
  void runCommand(AccessCommand command, IUIHost &host);

  void setMenuConfig(const std::string &sceneName, MenuLayoutConfig config);

  void onPlayerLeft(const std::optional<std::string> &playerName);
  void onMeetingStarted(const std::optional<std::string> &reporterColor);
  void onExileText(const std::string &text);

  AccessSettings &settings() { return m_settings; }
  const KeyBindings &keyBindings() const { return m_keyBindings; }
  MenuLayoutRegistry &menus() { return m_menus; }
  NavigationHandler &navigation() { return m_navigation; }
  UIFocusTracker &uiFocus() { return m_uiFocus; }
  const AnnouncementSink &sink() const { return m_sink; }

private:
  NavigationOptions navigationOptions() const;
  void onSettingChanged(const std::string &category, const std::string &key);

  AccessSettings m_settings{};
  AnnouncementSink m_sink;
  MenuLayoutRegistry m_menus{};
  NavigationHandler m_navigation;
  UIFocusTracker m_uiFocus;
  KeyBindings m_keyBindings{};

  std::vector<size_t> m_listenerIds{};
  bool m_initialized{false};
};

// "filter" or "advisory", case-insensitive; anything else is HARD_FILTER
VisibilityPolicy parseVisibilityPolicy(const std::string &value);

} // namespace AccessOverlay

#endif // ACCESSIBILITY_OVERLAY_HPP
