// SPDX-License-Identifier: Apache-2.0
#include "sim/movement.hpp"

#include "common/log_rate_limit.hpp"

#include <algorithm>
#include <cmath>

namespace botarena::sim {

bool against_wall(Vec2 pos, const BattleConfig &cfg)
{
    const float band = kWallMargin + kWallContactBuffer;
    return pos.x <= band || pos.x >= cfg.arena_width - band || pos.y <= band || pos.y >= cfg.arena_height - band;
}

Vec2 wall_escape_vector(Vec2 pos, const BattleConfig &cfg)
{
    const float band = kWallMargin + kWallContactBuffer;
    Vec2 push{0.f, 0.f};
    if (pos.x <= band)
        push.x += 1.f;
    else if (pos.x >= cfg.arena_width - band)
        push.x -= 1.f;
    if (pos.y <= band)
        push.y += 1.f;
    else if (pos.y >= cfg.arena_height - band)
        push.y -= 1.f;
    return push;
}

float effective_speed(float angle_diff, float speed_mult, float agility)
{
    float abs_diff = std::fabs(angle_diff);
    float penalty = std::min(1.f, abs_diff / 90.f);
    float eff = speed_mult * (1.f - penalty * (1.f - agility));
    // Floor first; the sharp-turn clamps below override it.
    if (speed_mult > 0.f)
        eff = std::max(eff, std::min(speed_mult, kSpeedFloor));
    if (agility < 0.3f && abs_diff > 60.f)
        eff = speed_mult * 0.15f;
    if (abs_diff > 120.f)
        eff = speed_mult * std::max(0.2f, agility * 0.5f);
    return eff;
}

bool apply_movement(
    std::vector<AgentState> &agents, size_t idx, const MoveCommand &cmd, const BattleConfig &cfg, double now, double dt)
{
    AgentState &a = agents[idx];
    const float fdt = static_cast<float>(dt);
    float diff = wrap180(cmd.direction - a.orientation);
    float eff = effective_speed(diff, std::clamp(cmd.speed, 0.f, 1.f), a.agility);
    a.target_orientation = wrap360(cmd.direction);
    a.turning = std::fabs(diff) > 25.f;
    // Turn and move concurrently: rotate first, then advance along the new orientation.
    a.orientation = rotate_towards(a.orientation, cmd.direction, (a.rotation_speed + kRotationBoost) * fdt);
    Vec2 step = scaled(direction(a.orientation), a.speed * eff * fdt);
    Vec2 next = b2Add(a.position, step);

    const float lo = cfg.bot_radius + kArenaBuffer;
    const float hi_x = cfg.arena_width - cfg.bot_radius - kArenaBuffer;
    const float hi_y = cfg.arena_height - cfg.bot_radius - kArenaBuffer;
    bool hit_wall = false;
    if (next.x < lo) {
        next.x = lo;
        hit_wall = true;
    } else if (next.x > hi_x) {
        next.x = hi_x;
        hit_wall = true;
    }
    if (next.y < lo) {
        next.y = lo;
        hit_wall = true;
    } else if (next.y > hi_y) {
        next.y = hi_y;
        hit_wall = true;
    }
    if (hit_wall) {
        a.wall_escape_timer = kWallEscapeSeconds;
        a.last_wall_contact = now;
    }

    const float min_sep = cfg.bot_radius * kSeparationFactor;
    for (size_t j = 0; j < agents.size(); ++j) {
        const AgentState &o = agents[j];
        if (j == idx || !o.alive)
            continue;
        float cur = b2Distance(a.position, o.position);
        float nd = b2Distance(next, o.position);
        // Already overlapping: only a strictly separating move is allowed.
        bool reject = cur < min_sep ? nd <= cur : nd < min_sep;
        if (reject) {
            a.velocity = Vec2{0.f, 0.f};
            BOTARENA_LOG_EVERY_N(trace, 60, "[move] rejected agent={} near={} d={}", a.id, o.id, nd);
            return false;
        }
    }
    a.velocity = scaled(b2Sub(next, a.position), 1.f / fdt);
    a.position = next;
    return true;
}

void track_turret(AgentState &agent, const AgentState *target, double dt)
{
    float desired = agent.orientation;
    if (target && target->alive)
        desired = angle_to(agent.position, target->position);
    agent.weapon_orientation =
        rotate_towards(agent.weapon_orientation, desired, agent.turret_rotation_speed * static_cast<float>(dt));
}

} // namespace botarena::sim
