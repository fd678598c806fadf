/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACCESS_SETTINGS_HPP
#define ACCESS_SETTINGS_HPP

#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace AccessOverlay {

namespace SettingKeys {
inline constexpr const char *NAVIGATION = "navigation";
inline constexpr const char *VISIBILITY_BUFFER = "visibility_buffer";
inline constexpr const char *VISIBILITY_POLICY = "visibility_policy";
inline constexpr const char *BLOCKING_MASK = "blocking_mask";

inline constexpr const char *UI = "ui";
inline constexpr const char *VERTICAL_THRESHOLD = "vertical_threshold";

// Values are SDL scancodes
inline constexpr const char *CONTROLS = "controls";
inline constexpr const char *NEXT_ELEMENT = "next_element";
inline constexpr const char *PREVIOUS_ELEMENT = "previous_element";
inline constexpr const char *ACTIVATE_ELEMENT = "activate_element";
inline constexpr const char *SCAN_SURROUNDINGS = "scan_surroundings";
inline constexpr const char *FIND_NEAREST_TASK = "find_nearest_task";
} // namespace SettingKeys

/**
 * @brief Typed tuning values organised by category
 *
 * Owned by the overlay and handed to components by reference. Values are
 * kept in memory only; the host plugin seeds them from its own config
 * system at startup.
 *
 * Usage:
 *   AccessSettings settings;
 *   float buffer = settings.get<float>("navigation", "visibility_buffer", 0.3f);
 *   settings.set("controls", "next_element", 81);
 */
class AccessSettings {
public:
  using SettingValue = std::variant<int, float, bool, std::string>;

  /**
   * @brief Callback function type for change notifications
   * @param category The category that changed
   * @param key The setting key that changed
   * @param newValue The new value of the setting
   */
  using ChangeCallback = std::function<void(const std::string &category,
                                            const std::string &key,
                                            const SettingValue &newValue)>;

  AccessSettings() = default;
  AccessSettings(const AccessSettings &) = delete;
  AccessSettings &operator=(const AccessSettings &) = delete;

  /**
   * @brief Gets a typed setting value
   * @return The stored value, or defaultValue when missing or of another type
   */
  template <typename T>
  T get(const std::string &category, const std::string &key, T defaultValue = T{}) const;

  /**
   * @brief Sets a typed setting value and notifies listeners
   * @return false for an unsupported value type
   */
  template <typename T>
  bool set(const std::string &category, const std::string &key, const T &value);

  bool has(const std::string &category, const std::string &key) const;
  bool remove(const std::string &category, const std::string &key);
  bool clearCategory(const std::string &category);
  void clearAll();

  /**
   * @brief Registers a callback for setting changes
   * @param category Category to watch (empty string watches all categories)
   * @return Callback ID that can be used to unregister
   */
  size_t registerChangeListener(const std::string &category, ChangeCallback callback);
  void unregisterChangeListener(size_t callbackId);

  std::vector<std::string> getCategories() const;
  std::vector<std::string> getKeys(const std::string &category) const;

  // Fills every key the overlay reads that is not set yet
  void applyDefaults();

private:
  using CategorySettings = std::unordered_map<std::string, SettingValue>;

  struct ListenerInfo {
    size_t id;
    std::string category;
    ChangeCallback callback;
  };

  void notifyListeners(const std::string &category, const std::string &key,
                       const SettingValue &newValue);

  template <typename T>
  void setDefault(const std::string &category, const std::string &key, const T &value) {
    if (!has(category, key)) {
      m_settings[category][key] = SettingValue(value);
    }
  }

  std::unordered_map<std::string, CategorySettings> m_settings{};
  std::vector<ListenerInfo> m_listeners{};
  size_t m_nextCallbackId{0};
};

template <typename T>
T AccessSettings::get(const std::string &category, const std::string &key,
                      T defaultValue) const {
  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return defaultValue;
  }

  auto keyIt = categoryIt->second.find(key);
  if (keyIt == categoryIt->second.end()) {
    return defaultValue;
  }

  if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
    if (const T *value = std::get_if<T>(&keyIt->second)) {
      return *value;
    }
  }
  return defaultValue;
}

template <typename T>
bool AccessSettings::set(const std::string &category, const std::string &key,
                         const T &value) {
  SettingValue settingValue;

  if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
    settingValue = value;
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    settingValue = std::string(value);
  } else {
    return false;
  }

  m_settings[category][key] = settingValue;
  notifyListeners(category, key, settingValue);
  return true;
}

} // namespace AccessOverlay

#endif // ACCESS_SETTINGS_HPP
