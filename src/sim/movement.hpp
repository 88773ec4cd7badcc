// SPDX-License-Identifier: Apache-2.0
// movement.hpp - chassis steering (turn penalties, bounds, pairwise rejection) and weapon turret tracking.
#pragma once
#include "sim/types.hpp"

#include <vector>

namespace botarena::sim {

constexpr float kArenaBuffer = 40.f; // keep-out band inside the arena edge (plus radius)
constexpr float kWallMargin = 50.f;
constexpr float kWallContactBuffer = 25.f; // "against a wall" = within margin + buffer of an edge
constexpr float kRotationBoost = 4.f; // degrees per second added to every chassis
constexpr double kWallEscapeSeconds = 0.5;
constexpr float kSeparationFactor = 2.2f; // minimum centre distance in radii
constexpr float kSpeedFloor = 0.25f;

// Output of the AI for one agent and tick.
struct MoveCommand
{
    float direction{0.f}; // degrees
    float speed{0.f}; // multiplier of agent speed, [0, 1]
};

bool against_wall(Vec2 pos, const BattleConfig &cfg);

// Sum of unit pushes away from every touched wall; zero when clear of all walls.
Vec2 wall_escape_vector(Vec2 pos, const BattleConfig &cfg);

// Speed multiplier after turn penalties, given the signed angle between desired heading and orientation.
float effective_speed(float angle_diff, float speed_mult, float agility);

// Rotates agents[idx] toward the command direction, then advances along the resulting orientation.
// Returns false when the move was rejected by pairwise separation (orientation still updates).
bool apply_movement(std::vector<AgentState> &agents, size_t idx, const MoveCommand &cmd, const BattleConfig &cfg,
    double now, double dt);

// Weapon turret: follows the current target's bearing, or the chassis when there is none.
void track_turret(AgentState &agent, const AgentState *target, double dt);

} // namespace botarena::sim
