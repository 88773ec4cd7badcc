// SPDX-License-Identifier: Apache-2.0
// ai.hpp - per-tick target selection and behavior-driven steering.
#pragma once
#include "sim/movement.hpp"
#include "sim/world.hpp"

#include <array>

namespace botarena::sim {

constexpr double kTargetRecheckSeconds = 2.0;
constexpr float kPursuitFactor = 2.0f; // weapon agents ignore enemies beyond max_range * this
constexpr float kFurthestFactor = 1.5f;
constexpr float kDispersalRadius = 300.f;
constexpr float kWanderOffset = 100.f;
constexpr float kWanderArrive = 50.f;

// Stand-off distance the agent's behavior (or explicit engagement override) steers toward.
float preferred_range(const AgentState &a);
// Aggressive agents back off inside this.
float optimal_close_range(const AgentState &a);

// Best target index for agents[idx] under its priority, or kNoTarget.
int select_target(World &w, size_t idx);
// Re-selects every 2 s, or immediately when the current target is dead or (for healers) fully healed.
void update_targets(World &w);

struct BehaviorInput
{
    float distance{0.f};
    float target_angle{0.f}; // bearing to target, degrees
    float preferred{0.f};
    bool target_cornered{false};
    bool self_cornered{false};
    Vec2 wall_push{0.f, 0.f}; // escape vector at the agent's position
};

using BehaviorFn = MoveCommand (*)(World &w, size_t idx, const BehaviorInput &in);

// Indexed by Behavior.
const std::array<BehaviorFn, kBehaviorCount> &behavior_table();

MoveCommand protector_command(World &w, size_t idx);
MoveCommand wander_command(World &w, size_t idx);
MoveCommand dispersal_command(const World &w, size_t idx, Vec2 wall_push, bool blend_wall);

// Full priority ladder: wall escape, dispersal, protector, wander, min-range flee, max-range approach,
// stalemate override, then the behavior table.
MoveCommand decide(World &w, size_t idx);

} // namespace botarena::sim
