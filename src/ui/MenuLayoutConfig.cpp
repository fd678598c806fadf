/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/MenuLayoutConfig.hpp"
#include "core/Logger.hpp"
#include "ui/UIElementOrderer.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace AccessOverlay {

namespace {

constexpr const char *LOBBY_SCENE = "FindAGame";
constexpr const char *LOBBY_ENTRY = "JoinMMGame(Clone)";

// Looks an element up by object name first, then by display name
template <typename Map>
const typename Map::mapped_type *lookup(const Map &map, const IUIElement &element) {
  if (map.empty()) {
    return nullptr;
  }
  auto it = map.find(TextUtils::toLower(element.objectName()));
  if (it != map.end()) {
    return &it->second;
  }
  it = map.find(TextUtils::toLower(elementDisplayName(element)));
  if (it != map.end()) {
    return &it->second;
  }
  return nullptr;
}

bool isNumber(const std::string &text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

// Drops a trailing "<digits> of <digits>" list index from a label
std::string stripListIndex(const std::string &label) {
  std::string const trimmed = TextUtils::trim(label);
  size_t const totalStart = trimmed.rfind(' ');
  if (totalStart == std::string::npos || !isNumber(trimmed.substr(totalStart + 1))) {
    return trimmed;
  }

  constexpr std::string_view OF_WORD = " of";
  if (totalStart < OF_WORD.size() + 1 ||
      trimmed.compare(totalStart - OF_WORD.size(), OF_WORD.size(), OF_WORD) != 0) {
    return trimmed;
  }

  size_t const numberEnd = totalStart - OF_WORD.size();
  size_t const numberStart = trimmed.rfind(' ', numberEnd - 1);
  size_t const first = numberStart == std::string::npos ? 0 : numberStart + 1;
  if (!isNumber(trimmed.substr(first, numberEnd - first))) {
    return trimmed;
  }
  return TextUtils::trim(trimmed.substr(0, first));
}

} // namespace

const SpeechProvider *MenuLayoutConfig::speechProviderFor(const IUIElement &element) const {
  return lookup(customSpeechProviders, element);
}

const std::string *MenuLayoutConfig::speechTextFor(const IUIElement &element) const {
  return lookup(customSpeechText, element);
}

const ActionHandler *MenuLayoutConfig::actionFor(const IUIElement &element) const {
  return lookup(actionHandlers, element);
}

void MenuLayoutRegistry::setMenuConfig(const std::string &sceneName,
                                       MenuLayoutConfig config) {
  m_configs[sceneName] = std::make_shared<const MenuLayoutConfig>(std::move(config));
  UI_ACCESS_INFO(std::format("Menu layout registered for scene '{}'", sceneName));
}

std::shared_ptr<const MenuLayoutConfig>
MenuLayoutRegistry::find(const std::string &sceneName) const {
  auto it = m_configs.find(sceneName);
  if (it == m_configs.end()) {
    return nullptr;
  }
  return it->second;
}

bool MenuLayoutRegistry::remove(const std::string &sceneName) {
  return m_configs.erase(sceneName) > 0;
}

MenuLayoutBuilder::MenuLayoutBuilder(std::string sceneName)
    : m_sceneName(std::move(sceneName)) {}

MenuLayoutBuilder MenuLayoutBuilder::forScene(std::string sceneName) {
  return MenuLayoutBuilder(std::move(sceneName));
}

MenuLayoutBuilder &
MenuLayoutBuilder::withElements(const std::vector<std::string> &identifiers) {
  for (const auto &id : identifiers) {
    m_config.orderedElements.push_back(TextUtils::toLower(id));
  }
  return *this;
}

MenuLayoutBuilder &
MenuLayoutBuilder::hideElements(const std::vector<std::string> &identifiers) {
  for (const auto &id : identifiers) {
    m_config.hiddenElements.insert(TextUtils::toLower(id));
  }
  return *this;
}

MenuLayoutBuilder &MenuLayoutBuilder::hideUnorganized(bool hide) {
  m_config.hideUnorganizedElements = hide;
  return *this;
}

MenuLayoutBuilder &
MenuLayoutBuilder::requireElements(const std::vector<std::string> &identifiers) {
  for (const auto &id : identifiers) {
    m_config.requiredElements.insert(TextUtils::toLower(id));
  }
  return *this;
}

MenuLayoutBuilder &MenuLayoutBuilder::withCustomSpeech(const std::string &identifier,
                                                       std::string text) {
  m_config.customSpeechText[TextUtils::toLower(identifier)] = std::move(text);
  return *this;
}

MenuLayoutBuilder &
MenuLayoutBuilder::withCustomSpeechProvider(const std::string &identifier,
                                            SpeechProvider provider) {
  m_config.customSpeechProviders[TextUtils::toLower(identifier)] = std::move(provider);
  return *this;
}

MenuLayoutBuilder &MenuLayoutBuilder::withAction(const std::string &identifier,
                                                 ActionHandler handler) {
  m_config.actionHandlers[TextUtils::toLower(identifier)] = std::move(handler);
  return *this;
}

void MenuLayoutBuilder::apply(MenuLayoutRegistry &registry) const {
  registry.setMenuConfig(m_sceneName, build());
}

std::string describeLobbyEntry(const IUIElement &element) {
  try {
    std::string hostName = element.primaryLabel().value_or("");
    std::string const players = element.childText("PlayerCountText_TMP").value_or("");
    std::string const impostors = element.childText("ImpostorCountText_TMP").value_or("");
    std::string const language = element.childText("LanguageText").value_or("");

    // The focus tracker appends its own index
    hostName = stripListIndex(hostName);

    return std::format("{} lobby by {} with {} impostors and {} players", language,
                       hostName, impostors, players);
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Error reading lobby information: {}", e.what()));
    return "Error reading lobby information";
  } catch (...) {
    UI_ACCESS_ERROR("Unknown error reading lobby information");
    return "Error reading lobby information";
  }
}

void configureDefaultMenus(MenuLayoutRegistry &registry) {
  try {
    MenuLayoutBuilder::forScene(LOBBY_SCENE)
        .withElements({LOBBY_ENTRY})
        .withCustomSpeechProvider(LOBBY_ENTRY, describeLobbyEntry)
        .apply(registry);
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Error configuring menus: {}", e.what()));
  } catch (...) {
    UI_ACCESS_ERROR("Unknown error configuring menus");
  }
}

} // namespace AccessOverlay
