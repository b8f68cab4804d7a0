/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ACTIVATION_GATE_HPP
#define ENTITY_ACTIVATION_GATE_HPP

#include <cstdint>

namespace TickGuard {

struct EntityActivationConfig {
  bool distanceTiers{true};
  bool goalSelectorThrottle{true};
  int inactiveGoalInterval{20}; // 1 second at 20 TPS
  bool dabEnabled{true};
  double dabStartDistance{12.0};
  int dabMaxTickInterval{20};
};

/**
 * @brief Decides how often an entity's AI runs based on distance to the
 * nearest player
 *
 * Every gate staggers entities by (tick + entityId) so that entities sharing
 * an interval do not all skip the same ticks.
 *
 * Stateless apart from configuration; safe from any thread.
 */
class EntityActivationGate {
public:
  /**
   * @throws std::invalid_argument on non-positive intervals or a negative
   * start distance
   */
  explicit EntityActivationGate(const EntityActivationConfig &config);

  /**
   * @brief Fixed distance tiers: every tick inside 32 blocks, every 2nd to
   * 64, every 4th to 128, every 8th beyond
   */
  bool shouldTickAI(double distanceSqToNearestPlayer, int64_t tick,
                    int64_t entityId) const;

  /**
   * @brief True if an inactive entity should skip its goal selector this tick
   */
  bool shouldThrottleGoalSelector(bool inactive, int64_t tick,
                                  int64_t entityId) const;

  /**
   * @brief Dynamic activation of brain
   *
   * Interval grows linearly from 1 at dabStartDistance to dabMaxTickInterval
   * at the activation range.
   */
  bool shouldTickBrain(double distanceSqToNearestPlayer, int64_t tick,
                       int64_t entityId, double activationRangeSq) const;

  /**
   * @brief Interval used by shouldTickBrain at a given distance
   */
  int brainTickInterval(double distanceSqToNearestPlayer,
                        double activationRangeSq) const;

  // Tier interval used by shouldTickAI
  static int tierInterval(double distanceSqToNearestPlayer);

  const EntityActivationConfig &getConfig() const { return m_config; }

private:
  static constexpr double NEAR_DISTANCE_SQ = 32.0 * 32.0;
  static constexpr double MEDIUM_DISTANCE_SQ = 64.0 * 64.0;
  static constexpr double FAR_DISTANCE_SQ = 128.0 * 128.0;

  static bool onStaggeredTick(int64_t tick, int64_t entityId, int interval) {
    return (tick + entityId) % interval == 0;
  }

  EntityActivationConfig m_config;
};

} // namespace TickGuard

#endif // ENTITY_ACTIVATION_GATE_HPP
