// SPDX-License-Identifier: Apache-2.0
// world.hpp - mutable state of one battle, owned exclusively by its Battle for the whole run.
// Every per-tick component reads and writes through this struct; nothing here is shared between battles.
#pragma once
#include "sim/rng.hpp"
#include "sim/stalemate.hpp"
#include "sim/types.hpp"

#include <cstdint>
#include <vector>

namespace botarena::sim {

struct World
{
    BattleConfig cfg;
    std::vector<AgentState> agents; // insertion order is iteration order
    std::vector<Projectile> projectiles;
    std::vector<BattleEvent> events; // cleared at the start of every tick
    StalemateMonitor stalemate;
    Rng rng;
    uint64_t frame{0};
    double now{0.0};
    double dt{1.0 / 30.0};
    uint32_t next_projectile_id{1};

    explicit World(const BattleConfig &c) : cfg(c), rng(c.seed), dt(c.dt()) {}

    b2AABB arena() const { return b2AABB{{0.f, 0.f}, {cfg.arena_width, cfg.arena_height}}; }

    Vec2 center() const { return Vec2{cfg.arena_width * 0.5f, cfg.arena_height * 0.5f}; }

    const AgentState *target_of(const AgentState &a) const
    {
        if (a.target < 0 || static_cast<size_t>(a.target) >= agents.size())
            return nullptr;
        return &agents[static_cast<size_t>(a.target)];
    }

    void emit(EventKind kind, int actor, int subject, int32_t amount = 0, int intended = kNoTarget, uint32_t proj = 0)
    {
        events.push_back(BattleEvent{kind, actor, subject, intended, amount, proj});
    }
};

} // namespace botarena::sim
