// SPDX-License-Identifier: Apache-2.0
// combat.hpp - weapon firing and hit/heal resolution shared with the projectile system.
#pragma once
#include "sim/world.hpp"

namespace botarena::sim {

constexpr float kBlockingRadiusFactor = 1.2f; // teammates within radius*this of the shot line block it
constexpr float kPointBlankFxSeconds = 0.15f;

// True when a living teammate sits within the blocking radius of the shooter->target segment and is nearer to
// the shooter than the target is. A degenerate segment never blocks.
bool friendly_in_line_of_fire(const World &w, size_t shooter, size_t target);

// Fires agents[idx] at its current target if every gate passes (cooldown, range, cone, line of fire).
bool try_fire(World &w, size_t idx);
void update_combat(World &w);

// Damage from `shooter` (may be kNoTarget) to an enemy: credits stats, resets the stalemate clock on non-zero
// damage, emits hit (+ kill). Returns the damage applied.
int32_t resolve_enemy_hit(World &w, int shooter, size_t victim, int32_t damage, uint32_t projectile_id);
// Heal credited to the healer's damage_dealt. Returns the amount restored.
int32_t resolve_heal(World &w, int healer, size_t receiver, int32_t amount, uint32_t projectile_id);

} // namespace botarena::sim
