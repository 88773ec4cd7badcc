// SPDX-License-Identifier: Apache-2.0
#include "sim/projectiles.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/combat.hpp"

#include <algorithm>

namespace botarena::sim {

namespace {

// Fraction of the shooter's min range inside which a weapon without point-blank capability cannot score a hit.
constexpr float kMinRangeHitFactor = 0.95f;

bool touches(CollisionProvider &oracle, CollisionProvider &fallback, const AgentState &a, Vec2 point)
{
    HitTest r = oracle.test_point(a.plating, a.position, a.orientation, point);
    if (r == HitTest::unavailable)
        r = fallback.test_point(a.plating, a.position, a.orientation, point);
    return r == HitTest::hit;
}

// The victim has closed inside the shooter's minimum range while the round was in flight.
bool inside_dead_zone(const World &w, int shooter, const AgentState &victim)
{
    if (shooter < 0)
        return false;
    const AgentState &s = w.agents[static_cast<size_t>(shooter)];
    if (s.allows_point_blank)
        return false;
    return b2Distance(s.position, victim.position) < s.min_range * kMinRangeHitFactor;
}

} // namespace

void update_projectiles(World &w, CollisionProvider &oracle, CollisionProvider &fallback)
{
    const float fdt = static_cast<float>(w.dt);
    const b2AABB bounds = w.arena();
    for (auto &p : w.projectiles) {
        if (!p.alive)
            continue;
        if (p.ttl > 0.f) {
            p.ttl -= fdt;
            if (p.ttl <= 0.f) {
                p.alive = false;
                continue;
            }
        }
        p.position = b2MulAdd(p.position, fdt, p.velocity);
        if (!p.visual_only) {
            const int shooter_team = p.shooter >= 0 ? w.agents[static_cast<size_t>(p.shooter)].team : 0;
            for (size_t j = 0; j < w.agents.size(); ++j) {
                AgentState &a = w.agents[j];
                if (!a.alive || static_cast<int>(j) == p.shooter)
                    continue;
                if (!touches(oracle, fallback, a, p.position))
                    continue;
                const bool friendly = shooter_team != 0 && a.team == shooter_team;
                if (p.heal) {
                    // Heals pass through anyone they are not meant for.
                    if (!friendly && static_cast<int>(j) != p.target)
                        continue;
                    resolve_heal(w, p.shooter, j, p.damage, p.id);
                } else if (friendly) {
                    int32_t actual = a.take_damage(p.damage / 4);
                    w.emit(EventKind::blocked, p.shooter, static_cast<int>(j), actual, p.target, p.id);
                    metrics::inc(metrics::runtime().blocked_shots);
                    log::trace("[proj] {} blocked by teammate {} dmg={}", p.id, a.id, actual);
                } else if (inside_dead_zone(w, p.shooter, a)) {
                    log::trace("[proj] {} absorbed by {} inside the shooter's min range", p.id, a.id);
                } else {
                    resolve_enemy_hit(w, p.shooter, j, p.damage, p.id);
                }
                p.alive = false;
                break;
            }
        }
        if (p.alive && !inside(bounds, p.position))
            p.alive = false;
    }
    w.projectiles.erase(
        std::remove_if(w.projectiles.begin(), w.projectiles.end(), [](const Projectile &p) { return !p.alive; }),
        w.projectiles.end());
    metrics::runtime().projectiles_active.store(w.projectiles.size(), std::memory_order_relaxed);
}

} // namespace botarena::sim
