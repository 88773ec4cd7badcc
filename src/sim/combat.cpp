// SPDX-License-Identifier: Apache-2.0
#include "sim/combat.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cmath>
#include <cstdlib>

namespace botarena::sim {

bool friendly_in_line_of_fire(const World &w, size_t shooter, size_t target)
{
    const AgentState &s = w.agents[shooter];
    const AgentState &t = w.agents[target];
    const float block = w.cfg.bot_radius * kBlockingRadiusFactor;
    const float to_target = b2Distance(s.position, t.position);
    for (size_t j = 0; j < w.agents.size(); ++j) {
        const AgentState &f = w.agents[j];
        if (j == shooter || !f.alive || f.team != s.team)
            continue;
        float d_sq = segment_distance_sq(f.position, s.position, t.position);
        if (d_sq < 0.f)
            continue; // shooter and target coincide
        if (d_sq < block * block && b2Distance(s.position, f.position) < to_target)
            return true;
    }
    return false;
}

int32_t resolve_enemy_hit(World &w, int shooter, size_t victim, int32_t damage, uint32_t projectile_id)
{
    AgentState &v = w.agents[victim];
    int32_t actual = v.take_damage(damage);
    if (actual > 0)
        w.stalemate.on_enemy_damage(w.now);
    AgentState *s = shooter >= 0 ? &w.agents[static_cast<size_t>(shooter)] : nullptr;
    if (s)
        s->damage_dealt += actual;
    w.emit(EventKind::hit, shooter, static_cast<int>(victim), actual, kNoTarget, projectile_id);
    metrics::inc(metrics::runtime().hits);
    log::trace("[combat] hit {} -> {} dmg={} hp={}", s ? s->id : std::string("?"), v.id, actual, v.health);
    if (!v.alive) {
        if (s)
            ++s->kills;
        w.emit(EventKind::kill, shooter, static_cast<int>(victim), 0, kNoTarget, projectile_id);
        metrics::inc(metrics::runtime().kills);
        log::debug("[combat] kill {} by {} t={}", v.id, s ? s->id : std::string("?"), w.now);
    }
    return actual;
}

int32_t resolve_heal(World &w, int healer, size_t receiver, int32_t amount, uint32_t projectile_id)
{
    AgentState &r = w.agents[receiver];
    int32_t actual = r.heal(std::abs(amount));
    if (healer >= 0)
        w.agents[static_cast<size_t>(healer)].damage_dealt += actual;
    w.emit(EventKind::heal, healer, static_cast<int>(receiver), actual, kNoTarget, projectile_id);
    metrics::inc(metrics::runtime().heals);
    log::trace("[combat] heal {} +{} hp={}", r.id, actual, r.health);
    return actual;
}

bool try_fire(World &w, size_t idx)
{
    AgentState &a = w.agents[idx];
    if (!a.alive || a.target == kNoTarget || !a.can_shoot(w.now))
        return false;
    const size_t ti = static_cast<size_t>(a.target);
    AgentState &t = w.agents[ti];
    if (!t.alive)
        return false;
    const float d = b2Distance(a.position, t.position);
    if (!a.allows_point_blank && d < a.min_range)
        return false;
    if (d > a.max_range)
        return false;
    const float cone = 10.f + static_cast<float>(a.intelligence) * 3.f;
    if (angle_diff_abs(angle_to(a.position, t.position), a.weapon_orientation) > cone)
        return false;
    if (!a.is_healer && friendly_in_line_of_fire(w, idx, ti))
        return false;

    a.last_shot_time = w.now;
    Projectile p;
    p.id = w.next_projectile_id++;
    p.shooter = static_cast<int>(idx);
    p.target = a.target;
    p.heal = a.is_healer;
    p.kind = a.projectile;
    metrics::inc(metrics::runtime().shots_fired);
    w.emit(EventKind::shot, p.shooter, p.target, 0, kNoTarget, p.id);

    if (a.allows_point_blank && d < a.muzzle_offset) {
        // The muzzle would sit past the target: resolve directly and leave a stationary burst behind.
        if (a.is_healer)
            resolve_heal(w, p.shooter, ti, a.damage_per_shot, p.id);
        else
            resolve_enemy_hit(w, p.shooter, ti, a.damage_per_shot, p.id);
        p.position = t.position;
        p.velocity = Vec2{0.f, 0.f};
        p.damage = 0;
        p.visual_only = true;
        p.ttl = kPointBlankFxSeconds;
        log::trace("[combat] point-blank {} -> {} d={}", a.id, t.id, d);
    } else {
        Vec2 dir = direction(a.weapon_orientation);
        p.position = b2MulAdd(a.position, a.muzzle_offset, dir);
        p.velocity = scaled(dir, w.cfg.projectile_speed * projectile_speed_multiplier(a.projectile));
        p.damage = a.damage_per_shot;
        log::trace("[combat] shot {} -> {} proj={} d={}", a.id, t.id, p.id, d);
    }
    w.projectiles.push_back(p);
    return true;
}

void update_combat(World &w)
{
    for (size_t i = 0; i < w.agents.size(); ++i)
        try_fire(w, i);
}

} // namespace botarena::sim
