/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "input/KeyBindings.hpp"
#include "core/Logger.hpp"
#include "managers/AccessSettings.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace AccessOverlay {

namespace {

struct ControlSetting {
  const char *key;
  AccessCommand command;
};

constexpr std::array<ControlSetting, 5> CONTROL_SETTINGS{{
    {SettingKeys::NEXT_ELEMENT, AccessCommand::NEXT_ELEMENT},
    {SettingKeys::PREVIOUS_ELEMENT, AccessCommand::PREVIOUS_ELEMENT},
    {SettingKeys::ACTIVATE_ELEMENT, AccessCommand::ACTIVATE_ELEMENT},
    {SettingKeys::SCAN_SURROUNDINGS, AccessCommand::SCAN_SURROUNDINGS},
    {SettingKeys::FIND_NEAREST_TASK, AccessCommand::FIND_NEAREST_TASK},
}};

} // namespace

const char *toString(AccessCommand command) {
  switch (command) {
  case AccessCommand::NEXT_ELEMENT:
    return "next element";
  case AccessCommand::PREVIOUS_ELEMENT:
    return "previous element";
  case AccessCommand::ACTIVATE_ELEMENT:
    return "activate element";
  case AccessCommand::SCAN_SURROUNDINGS:
    return "scan surroundings";
  case AccessCommand::FIND_NEAREST_TASK:
    return "find nearest task";
  case AccessCommand::NONE:
    break;
  }
  return "none";
}

KeyBindings::KeyBindings() { resetToDefaults(); }

void KeyBindings::resetToDefaults() {
  m_bindings.clear();
  m_bindings.emplace(SDL_SCANCODE_DOWN, AccessCommand::NEXT_ELEMENT);
  m_bindings.emplace(SDL_SCANCODE_UP, AccessCommand::PREVIOUS_ELEMENT);
  m_bindings.emplace(SDL_SCANCODE_RETURN, AccessCommand::ACTIVATE_ELEMENT);
  m_bindings.emplace(SDL_SCANCODE_TAB, AccessCommand::SCAN_SURROUNDINGS);
  m_bindings.emplace(SDL_SCANCODE_T, AccessCommand::FIND_NEAREST_TASK);
}

void KeyBindings::bind(SDL_Scancode key, AccessCommand command) {
  if (key == SDL_SCANCODE_UNKNOWN || command == AccessCommand::NONE) {
    return;
  }
  unbind(command);
  m_bindings[key] = command;
  INPUT_DEBUG(std::format("Bound scancode {} to {}", static_cast<int>(key), toString(command)));
}

void KeyBindings::unbind(AccessCommand command) {
  for (auto it = m_bindings.begin(); it != m_bindings.end();) {
    if (it->second == command) {
      it = m_bindings.erase(it);
    } else {
      ++it;
    }
  }
}

void KeyBindings::loadFrom(const AccessSettings &settings) {
  for (const auto &control : CONTROL_SETTINGS) {
    loadBinding(settings, control.key);
  }
}

void KeyBindings::loadBinding(const AccessSettings &settings, const std::string &settingKey) {
  auto const control = std::find_if(CONTROL_SETTINGS.begin(), CONTROL_SETTINGS.end(),
                                    [&settingKey](const ControlSetting &entry) {
                                      return settingKey == entry.key;
                                    });
  if (control == CONTROL_SETTINGS.end()) {
    INPUT_WARN(std::format("Unknown control setting '{}'", settingKey));
    return;
  }
  if (!settings.has(SettingKeys::CONTROLS, settingKey)) {
    return;
  }

  int const scancode = settings.get<int>(SettingKeys::CONTROLS, settingKey, -1);
  if (scancode <= SDL_SCANCODE_UNKNOWN || scancode >= SDL_SCANCODE_COUNT) {
    INPUT_WARN(std::format("Ignoring invalid scancode {} for '{}'", scancode, settingKey));
    return;
  }
  bind(static_cast<SDL_Scancode>(scancode), control->command);
}

AccessCommand KeyBindings::commandFor(SDL_Scancode key) const {
  auto it = m_bindings.find(key);
  return it != m_bindings.end() ? it->second : AccessCommand::NONE;
}

SDL_Scancode KeyBindings::keyFor(AccessCommand command) const {
  for (const auto &[key, bound] : m_bindings) {
    if (bound == command) {
      return key;
    }
  }
  return SDL_SCANCODE_UNKNOWN;
}

AccessCommand KeyBindings::translate(const SDL_Event &event) const {
  if (event.type != SDL_EVENT_KEY_DOWN || event.key.repeat) {
    return AccessCommand::NONE;
  }
  return commandFor(event.key.scancode);
}

} // namespace AccessOverlay
