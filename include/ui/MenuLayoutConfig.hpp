/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MENU_LAYOUT_CONFIG_HPP
#define MENU_LAYOUT_CONFIG_HPP

#include "host/HostInterfaces.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace AccessOverlay {

using SpeechProvider = std::function<std::string(const IUIElement &)>;
using ActionHandler = std::function<void(const IUIElement &)>;

/**
 * @brief Per-scene ordering, hiding and speech rules for UI elements.
 *
 * Identifiers match an element's display name or object name, ignoring
 * case. Every identifier is stored lower-cased. A config is immutable once
 * registered; changing a scene means registering a new config.
 */
struct MenuLayoutConfig {
  // Explicit placement priority
  std::vector<std::string> orderedElements{};
  std::unordered_set<std::string> hiddenElements{};
  // Drop elements that are neither ordered nor hidden instead of appending them
  bool hideUnorganizedElements{false};
  // The layout only applies while every one of these is on screen
  std::unordered_set<std::string> requiredElements{};

  std::unordered_map<std::string, std::string> customSpeechText{};
  std::unordered_map<std::string, SpeechProvider> customSpeechProviders{};
  std::unordered_map<std::string, ActionHandler> actionHandlers{};

  const SpeechProvider *speechProviderFor(const IUIElement &element) const;
  const std::string *speechTextFor(const IUIElement &element) const;
  const ActionHandler *actionFor(const IUIElement &element) const;
};

/**
 * @brief Scene name to layout mapping.
 *
 * setMenuConfig() replaces a scene's entry wholesale; configs handed out
 * by find() stay valid even if the entry is replaced later.
 */
class MenuLayoutRegistry {
public:
  void setMenuConfig(const std::string &sceneName, MenuLayoutConfig config);
  std::shared_ptr<const MenuLayoutConfig> find(const std::string &sceneName) const;
  bool remove(const std::string &sceneName);
  size_t size() const { return m_configs.size(); }

private:
  std::unordered_map<std::string, std::shared_ptr<const MenuLayoutConfig>> m_configs{};
};

/**
 * @brief Chained declaration of a scene layout.
 *
 * Usage:
 *   MenuLayoutBuilder::forScene("FindAGame")
 *       .withElements({"JoinMMGame(Clone)"})
 *       .withCustomSpeechProvider("JoinMMGame(Clone)", describeLobby)
 *       .apply(registry);
 */
class MenuLayoutBuilder {
public:
  static MenuLayoutBuilder forScene(std::string sceneName);

  MenuLayoutBuilder &withElements(const std::vector<std::string> &identifiers);
  MenuLayoutBuilder &hideElements(const std::vector<std::string> &identifiers);
  MenuLayoutBuilder &hideUnorganized(bool hide = true);
  MenuLayoutBuilder &requireElements(const std::vector<std::string> &identifiers);
  MenuLayoutBuilder &withCustomSpeech(const std::string &identifier, std::string text);
  MenuLayoutBuilder &withCustomSpeechProvider(const std::string &identifier,
                                              SpeechProvider provider);
  MenuLayoutBuilder &withAction(const std::string &identifier, ActionHandler handler);

  MenuLayoutConfig build() const { return m_config; }
  void apply(MenuLayoutRegistry &registry) const;

  const std::string &sceneName() const { return m_sceneName; }

private:
  explicit MenuLayoutBuilder(std::string sceneName);

  std::string m_sceneName;
  MenuLayoutConfig m_config{};
};

// Registers the layouts shipped with the overlay
void configureDefaultMenus(MenuLayoutRegistry &registry);

// Speech for one lobby entry of the game-finder list
std::string describeLobbyEntry(const IUIElement &element);

} // namespace AccessOverlay

#endif // MENU_LAYOUT_CONFIG_HPP
