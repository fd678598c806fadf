/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UI_ELEMENT_ORDERER_HPP
#define UI_ELEMENT_ORDERER_HPP

#include "host/HostInterfaces.hpp"
#include <string>
#include <vector>

namespace AccessOverlay {

struct MenuLayoutConfig;

// Label, then secondary label, then object name, then "Unnamed Button"
std::string elementDisplayName(const IUIElement &element);

// Case-insensitive match against the display name or the object name
bool elementMatches(const IUIElement &element, const std::string &identifier);

/**
 * @brief Linear reading order for the selectable elements of a screen.
 *
 * Default order reads rows top to bottom and each row left to right. Rows
 * are formed by bucketing y with the vertical threshold so float jitter
 * between elements of one row does not split it. Identity breaks the
 * remaining ties, so the output never depends on the input order.
 */
class UIElementOrderer {
public:
  static constexpr float DEFAULT_VERTICAL_THRESHOLD = 0.1f;

  explicit UIElementOrderer(float verticalThreshold = DEFAULT_VERTICAL_THRESHOLD)
      : m_verticalThreshold(verticalThreshold > 0.0f ? verticalThreshold
                                                     : DEFAULT_VERTICAL_THRESHOLD) {}

  /**
   * @brief Orders the active elements, applying config when it is active
   * @param elements Raw host elements; null and inactive entries are dropped
   * @param config Scene layout or null
   */
  std::vector<UIElementPtr> sort(const std::vector<UIElementPtr> &elements,
                                 const MenuLayoutConfig *config) const;

  std::vector<UIElementPtr> defaultSort(std::vector<UIElementPtr> elements) const;

  // True when every required identifier matches one of the elements
  static bool requirementsMet(const std::vector<UIElementPtr> &elements,
                              const MenuLayoutConfig &config);

  float verticalThreshold() const { return m_verticalThreshold; }

private:
  long rowBucket(const IUIElement &element) const;

  float m_verticalThreshold;
};

} // namespace AccessOverlay

#endif // UI_ELEMENT_ORDERER_HPP
