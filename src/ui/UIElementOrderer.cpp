/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/UIElementOrderer.hpp"
#include "core/Logger.hpp"
#include "ui/MenuLayoutConfig.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace AccessOverlay {

namespace {

constexpr const char *UNNAMED_ELEMENT = "Unnamed Button";

std::vector<UIElementPtr> activeUnique(const std::vector<UIElementPtr> &elements) {
  std::vector<UIElementPtr> result;
  result.reserve(elements.size());
  std::unordered_set<int> seen;
  for (const auto &element : elements) {
    if (!element || !element->isActiveAndEnabled()) {
      continue;
    }
    if (seen.insert(element->instanceId()).second) {
      result.push_back(element);
    }
  }
  return result;
}

} // namespace

std::string elementDisplayName(const IUIElement &element) {
  try {
    auto const primary = element.primaryLabel();
    if (primary && !primary->empty()) {
      return *primary;
    }

    auto const secondary = element.secondaryLabel();
    if (secondary && !secondary->empty()) {
      return *secondary;
    }

    std::string const name = element.objectName();
    if (!name.empty()) {
      return name;
    }
  } catch (const std::exception &e) {
    UI_ACCESS_ERROR(std::format("Error reading element label: {}", e.what()));
  } catch (...) {
    UI_ACCESS_ERROR("Unknown error reading element label");
  }
  return UNNAMED_ELEMENT;
}

bool elementMatches(const IUIElement &element, const std::string &identifier) {
  return TextUtils::equalsIgnoreCase(element.objectName(), identifier) ||
         TextUtils::equalsIgnoreCase(elementDisplayName(element), identifier);
}

long UIElementOrderer::rowBucket(const IUIElement &element) const {
  return std::lround(element.position().getY() / m_verticalThreshold);
}

std::vector<UIElementPtr>
UIElementOrderer::defaultSort(std::vector<UIElementPtr> elements) const {
  std::sort(elements.begin(), elements.end(),
            [this](const UIElementPtr &a, const UIElementPtr &b) {
              long const rowA = rowBucket(*a);
              long const rowB = rowBucket(*b);
              if (rowA != rowB) {
                return rowA > rowB; // higher rows read first
              }
              float const xA = a->position().getX();
              float const xB = b->position().getX();
              if (xA != xB) {
                return xA < xB;
              }
              return a->instanceId() < b->instanceId();
            });
  return elements;
}

bool UIElementOrderer::requirementsMet(const std::vector<UIElementPtr> &elements,
                                       const MenuLayoutConfig &config) {
  return std::all_of(
      config.requiredElements.begin(), config.requiredElements.end(),
      [&elements](const std::string &required) {
        return std::any_of(elements.begin(), elements.end(),
                           [&required](const UIElementPtr &element) {
                             return element && elementMatches(*element, required);
                           });
      });
}

std::vector<UIElementPtr>
UIElementOrderer::sort(const std::vector<UIElementPtr> &elements,
                       const MenuLayoutConfig *config) const {
  std::vector<UIElementPtr> active = activeUnique(elements);

  if (config == nullptr || !requirementsMet(active, *config)) {
    return defaultSort(std::move(active));
  }

  // Hidden elements go first so an element both ordered and hidden stays hidden
  active.erase(std::remove_if(active.begin(), active.end(),
                              [config](const UIElementPtr &element) {
                                return std::any_of(
                                    config->hiddenElements.begin(),
                                    config->hiddenElements.end(),
                                    [&element](const std::string &hidden) {
                                      return elementMatches(*element, hidden);
                                    });
                              }),
               active.end());

  std::vector<UIElementPtr> const positional = defaultSort(std::move(active));
  std::vector<UIElementPtr> result;
  result.reserve(positional.size());
  std::unordered_set<int> placed;

  // Several elements may share an identifier (list entries); they keep
  // their positional order inside their slot
  for (const auto &identifier : config->orderedElements) {
    for (const auto &element : positional) {
      if (placed.count(element->instanceId()) == 0 &&
          elementMatches(*element, identifier)) {
        placed.insert(element->instanceId());
        result.push_back(element);
      }
    }
  }

  if (!config->hideUnorganizedElements) {
    for (const auto &element : positional) {
      if (placed.count(element->instanceId()) == 0) {
        result.push_back(element);
      }
    }
  }

  return result;
}

} // namespace AccessOverlay
