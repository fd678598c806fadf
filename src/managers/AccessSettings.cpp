/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AccessSettings.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace AccessOverlay {

namespace {

// SDL_SCANCODE_* values, spelled out so this target stays free of SDL
constexpr int SCANCODE_RETURN = 40;
constexpr int SCANCODE_TAB = 43;
constexpr int SCANCODE_T = 23;
constexpr int SCANCODE_DOWN = 81;
constexpr int SCANCODE_UP = 82;

} // namespace

bool AccessSettings::has(const std::string &category, const std::string &key) const {
  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return false;
  }
  return categoryIt->second.find(key) != categoryIt->second.end();
}

bool AccessSettings::remove(const std::string &category, const std::string &key) {
  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return false;
  }

  if (categoryIt->second.erase(key) == 0) {
    return false;
  }

  if (categoryIt->second.empty()) {
    m_settings.erase(categoryIt);
  }
  return true;
}

bool AccessSettings::clearCategory(const std::string &category) {
  return m_settings.erase(category) > 0;
}

void AccessSettings::clearAll() { m_settings.clear(); }

size_t AccessSettings::registerChangeListener(const std::string &category,
                                              ChangeCallback callback) {
  size_t const id = m_nextCallbackId++;
  m_listeners.push_back({id, category, std::move(callback)});
  return id;
}

void AccessSettings::unregisterChangeListener(size_t callbackId) {
  m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                   [callbackId](const ListenerInfo &info) {
                                     return info.id == callbackId;
                                   }),
                    m_listeners.end());
}

std::vector<std::string> AccessSettings::getCategories() const {
  std::vector<std::string> categories;
  categories.reserve(m_settings.size());
  for (const auto &[category, _] : m_settings) {
    categories.push_back(category);
  }
  return categories;
}

std::vector<std::string> AccessSettings::getKeys(const std::string &category) const {
  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return {};
  }

  std::vector<std::string> keys;
  keys.reserve(categoryIt->second.size());
  for (const auto &[key, _] : categoryIt->second) {
    keys.push_back(key);
  }
  return keys;
}

void AccessSettings::applyDefaults() {
  using namespace SettingKeys;

  setDefault(NAVIGATION, VISIBILITY_BUFFER, 0.3f);
  setDefault(NAVIGATION, VISIBILITY_POLICY, std::string("filter"));
  setDefault(NAVIGATION, BLOCKING_MASK, -1); // every layer

  setDefault(UI, VERTICAL_THRESHOLD, 0.1f);

  setDefault(CONTROLS, NEXT_ELEMENT, SCANCODE_DOWN);
  setDefault(CONTROLS, PREVIOUS_ELEMENT, SCANCODE_UP);
  setDefault(CONTROLS, ACTIVATE_ELEMENT, SCANCODE_RETURN);
  setDefault(CONTROLS, SCAN_SURROUNDINGS, SCANCODE_TAB);
  setDefault(CONTROLS, FIND_NEAREST_TASK, SCANCODE_T);
}

void AccessSettings::notifyListeners(const std::string &category,
                                     const std::string &key,
                                     const SettingValue &newValue) {
  // Copy so a listener may unregister itself while being notified
  std::vector<ListenerInfo> const listeners = m_listeners;
  for (const auto &listener : listeners) {
    if (!listener.category.empty() && listener.category != category) {
      continue;
    }
    try {
      listener.callback(category, key, newValue);
    } catch (const std::exception &e) {
      SETTINGS_ERROR(std::format("Listener for '{}.{}' failed: {}", category, key, e.what()));
    } catch (...) {
      SETTINGS_ERROR(std::format("Listener for '{}.{}' failed with an unknown exception", category, key));
    }
  }
}

} // namespace AccessOverlay
