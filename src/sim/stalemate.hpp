// SPDX-License-Identifier: Apache-2.0
// stalemate.hpp - no-damage escalation: Normal -> Stalemate -> Dispersal -> (timeout) -> Normal.
#pragma once
#include "sim/types.hpp"

#include <optional>
#include <vector>

namespace botarena::sim {

enum class StalemateState : uint8_t
{
    normal,
    stalemate, // team 1 forced to charge, team 2 holds
    dispersal // everyone pushed away from the local crowd
};

const char *stalemate_state_name(StalemateState s);

struct StalemateTuning
{
    double stalemate_after{3.0}; // seconds without enemy damage
    double dispersal_after{9.0}; // seconds without enemy damage, requires corner-lock
    double dispersal_duration{6.0};
};

// Any pair of enemies (both without point-blank capability) mutually inside each other's min range, or at least
// two living agents against a wall.
bool detect_corner_lock(const std::vector<AgentState> &agents, const BattleConfig &cfg);

class StalemateMonitor
{
public:
    explicit StalemateMonitor(StalemateTuning tuning = {}) : tuning_(tuning) {}

    // Advances the state machine at the start of a tick. Returns the engagement event for a transition into
    // stalemate or dispersal (at most one transition per tick).
    std::optional<EventKind> update(double now, const std::vector<AgentState> &agents, const BattleConfig &cfg);

    // Damage dealt to an enemy: resets the clock and clears stalemate (an active dispersal keeps counting down).
    void on_enemy_damage(double now);

    StalemateState state() const { return state_; }
    bool stalemate_engaged() const { return state_ == StalemateState::stalemate; }
    bool dispersal_engaged() const { return state_ == StalemateState::dispersal; }
    double last_damage_time() const { return last_damage_time_; }
    double time_since_damage(double now) const { return now - last_damage_time_; }
    double dispersal_started() const { return dispersal_started_; }

private:
    StalemateTuning tuning_;
    StalemateState state_{StalemateState::normal};
    double last_damage_time_{0.0};
    double dispersal_started_{0.0};
};

} // namespace botarena::sim
