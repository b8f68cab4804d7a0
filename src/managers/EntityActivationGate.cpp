/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityActivationGate.hpp"

#include <stdexcept>

namespace TickGuard {

EntityActivationGate::EntityActivationGate(const EntityActivationConfig &config)
    : m_config(config) {
  if (m_config.inactiveGoalInterval <= 0) {
    throw std::invalid_argument("inactive goal interval must be positive");
  }
  if (m_config.dabMaxTickInterval <= 0) {
    throw std::invalid_argument("DAB max tick interval must be positive");
  }
  if (m_config.dabStartDistance < 0.0) {
    throw std::invalid_argument("DAB start distance must be >= 0");
  }
}

int EntityActivationGate::tierInterval(double distanceSqToNearestPlayer) {
  if (distanceSqToNearestPlayer < NEAR_DISTANCE_SQ) {
    return 1;
  }
  if (distanceSqToNearestPlayer < MEDIUM_DISTANCE_SQ) {
    return 2;
  }
  if (distanceSqToNearestPlayer < FAR_DISTANCE_SQ) {
    return 4;
  }
  return 8;
}

bool EntityActivationGate::shouldTickAI(double distanceSqToNearestPlayer,
                                        int64_t tick, int64_t entityId) const {
  if (!m_config.distanceTiers) {
    return true;
  }
  return onStaggeredTick(tick, entityId, tierInterval(distanceSqToNearestPlayer));
}

bool EntityActivationGate::shouldThrottleGoalSelector(bool inactive, int64_t tick,
                                                      int64_t entityId) const {
  if (!m_config.goalSelectorThrottle || !inactive) {
    return false;
  }
  return !onStaggeredTick(tick, entityId, m_config.inactiveGoalInterval);
}

int EntityActivationGate::brainTickInterval(double distanceSqToNearestPlayer,
                                            double activationRangeSq) const {
  const double startDistSq = m_config.dabStartDistance * m_config.dabStartDistance;
  if (distanceSqToNearestPlayer <= startDistSq) {
    return 1;
  }
  if (distanceSqToNearestPlayer >= activationRangeSq ||
      activationRangeSq <= startDistSq) {
    return m_config.dabMaxTickInterval;
  }

  const double t = (distanceSqToNearestPlayer - startDistSq) /
                   (activationRangeSq - startDistSq);
  return 1 + static_cast<int>(t * (m_config.dabMaxTickInterval - 1));
}

bool EntityActivationGate::shouldTickBrain(double distanceSqToNearestPlayer,
                                           int64_t tick, int64_t entityId,
                                           double activationRangeSq) const {
  if (!m_config.dabEnabled) {
    return true;
  }
  return onStaggeredTick(tick, entityId,
                         brainTickInterval(distanceSqToNearestPlayer,
                                           activationRangeSq));
}

} // namespace TickGuard
