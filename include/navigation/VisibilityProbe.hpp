/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VISIBILITY_PROBE_HPP
#define VISIBILITY_PROBE_HPP

#include "host/HostInterfaces.hpp"
#include <cstdint>

namespace AccessOverlay {

/**
 * @brief Five-sample line-of-sight heuristic over the host raycast.
 *
 * Casts one ray at the target and four at points offset by the buffer
 * along each axis. Each ray travels at most the observer-target distance
 * against the blocking mask. The target counts as visible when any ray is
 * unobstructed or when a hit lands within the buffer of its sample point
 * (the ray grazed the target rather than an occluder).
 *
 * This is an approximation: thin occluders between samples are missed and
 * a large target can be reported hidden while partly visible.
 */
class VisibilityProbe {
public:
  static constexpr float DEFAULT_BUFFER = 0.3f;

  VisibilityProbe(const IRaycaster &raycaster, uint32_t blockingMask,
                  float buffer = DEFAULT_BUFFER)
      : m_raycaster(raycaster), m_blockingMask(blockingMask),
        m_buffer(buffer) {}

  bool isVisible(const Vector2D &observer, const Vector2D &target) const;

  float buffer() const { return m_buffer; }
  uint32_t blockingMask() const { return m_blockingMask; }
  void setBuffer(float buffer) { m_buffer = buffer; }
  void setBlockingMask(uint32_t mask) { m_blockingMask = mask; }

private:
  const IRaycaster &m_raycaster;
  uint32_t m_blockingMask;
  float m_buffer;
};

} // namespace AccessOverlay

#endif // VISIBILITY_PROBE_HPP
