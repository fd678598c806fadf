/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef KEY_BINDINGS_HPP
#define KEY_BINDINGS_HPP

#include <SDL3/SDL.h>
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <string>

namespace AccessOverlay {

class AccessSettings;

enum class AccessCommand : uint8_t {
  NONE,
  NEXT_ELEMENT,
  PREVIOUS_ELEMENT,
  ACTIVATE_ELEMENT,
  SCAN_SURROUNDINGS,
  FIND_NEAREST_TASK
};

const char *toString(AccessCommand command);

/**
 * @brief Keyboard scancode to overlay command mapping.
 *
 * Each command has at most one key. Binding a command to a new key drops
 * its previous key, and binding a key already used by another command
 * takes the key over.
 */
class KeyBindings {
public:
  // Down, Up, Return, Tab and T
  KeyBindings();

  void bind(SDL_Scancode key, AccessCommand command);
  void unbind(AccessCommand command);
  void resetToDefaults();

  // Reads every "controls" entry; missing or out of range entries keep the current key
  void loadFrom(const AccessSettings &settings);
  // Applies one "controls" entry, e.g. after the player changed it
  void loadBinding(const AccessSettings &settings, const std::string &settingKey);

  AccessCommand commandFor(SDL_Scancode key) const;
  SDL_Scancode keyFor(AccessCommand command) const;

  /**
   * @brief Maps one host event to a command
   * @return NONE unless the event is a first key-down of a bound key;
   *         auto-repeat events never produce a command
   */
  AccessCommand translate(const SDL_Event &event) const;

private:
  boost::container::flat_map<SDL_Scancode, AccessCommand> m_bindings{};
};

} // namespace AccessOverlay

#endif // KEY_BINDINGS_HPP
