/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ANNOUNCEMENT_SINK_HPP
#define ANNOUNCEMENT_SINK_HPP

#include <cstddef>
#include <string>

namespace AccessOverlay {

// Screen-reader bridge implemented by the host plugin
class ISpeechSink {
public:
  virtual ~ISpeechSink() = default;

  virtual void speak(const std::string &text, bool interrupt = false) = 0;
};

/**
 * @brief Fire-and-forget front end for a speech backend.
 *
 * Empty text is dropped, every utterance is logged, and a backend failure
 * is logged and swallowed so a broken screen reader never stops a tick.
 * Components receive a reference to this object at construction.
 */
class AnnouncementSink {
public:
  explicit AnnouncementSink(ISpeechSink &backend) : m_backend(backend) {}

  void speak(const std::string &text, bool interrupt = false);

  size_t droppedCount() const { return m_dropped; }

private:
  ISpeechSink &m_backend;
  size_t m_dropped{0};
};

} // namespace AccessOverlay

#endif // ANNOUNCEMENT_SINK_HPP
