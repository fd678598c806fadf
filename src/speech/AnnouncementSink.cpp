/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "speech/AnnouncementSink.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace AccessOverlay {

void AnnouncementSink::speak(const std::string &text, bool interrupt) {
  if (text.empty()) {
    return;
  }

  try {
    m_backend.speak(text, interrupt);
    SPEECH_INFO(std::format("Speech output: {}{}", text, interrupt ? " (interrupt)" : ""));
  } catch (const std::exception &e) {
    ++m_dropped;
    SPEECH_ERROR(std::format("Speech output failed for '{}': {}", text, e.what()));
  } catch (...) {
    ++m_dropped;
    SPEECH_ERROR(std::format("Speech output failed for '{}' with an unknown exception", text));
  }
}

} // namespace AccessOverlay
