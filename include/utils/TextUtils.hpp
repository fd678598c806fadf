/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>

namespace AccessOverlay {
namespace TextUtils {

inline std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

inline bool equalsIgnoreCase(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

inline std::string trim(const std::string &text) {
  size_t const first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  size_t const last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

inline void eraseAll(std::string &text, const std::string &token) {
  if (token.empty()) {
    return;
  }
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.erase(pos, token.size());
  }
}

} // namespace TextUtils
} // namespace AccessOverlay

#endif // TEXT_UTILS_HPP
