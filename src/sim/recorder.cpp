// SPDX-License-Identifier: Apache-2.0
#include "sim/recorder.hpp"

#include <algorithm>
#include <utility>

namespace botarena::sim {

FrameSnapshot capture_frame(const World &w)
{
    FrameSnapshot f;
    f.frame = w.frame;
    f.time = w.now;
    f.stalemate = w.stalemate.state();
    f.agents.reserve(w.agents.size());
    for (size_t i = 0; i < w.agents.size(); ++i) {
        const AgentState &a = w.agents[i];
        f.agents.push_back(AgentView{static_cast<uint32_t>(i), a.position.x, a.position.y, a.velocity.x, a.velocity.y,
            a.orientation, a.weapon_orientation, a.health, a.alive, a.target, a.turning});
    }
    f.projectiles.reserve(w.projectiles.size());
    for (const auto &p : w.projectiles) {
        f.projectiles.push_back(ProjectileView{p.id, p.shooter, p.target, p.position.x, p.position.y, p.velocity.x,
            p.velocity.y, p.damage, p.heal, p.visual_only, p.kind, p.ttl});
    }
    f.events = w.events;
    return f;
}

const AgentSummary *BattleResult::find(const std::string &id) const
{
    auto it = std::find_if(agents.begin(), agents.end(), [&](const AgentSummary &a) { return a.id == id; });
    return it != agents.end() ? &*it : nullptr;
}

int winner_of(const std::vector<AgentState> &agents)
{
    bool t1 = std::any_of(agents.begin(), agents.end(), [](const AgentState &a) { return a.team == 1 && a.alive; });
    bool t2 = std::any_of(agents.begin(), agents.end(), [](const AgentState &a) { return a.team == 2 && a.alive; });
    if (t1 && !t2)
        return 1;
    if (t2 && !t1)
        return 2;
    return 0;
}

BattleResult build_result(const World &w, std::vector<FrameSnapshot> frames, bool cancelled)
{
    BattleResult r;
    r.winner_team = winner_of(w.agents);
    r.total_frames = frames.size();
    r.duration = static_cast<double>(r.total_frames) / static_cast<double>(w.cfg.fps);
    r.config = w.cfg;
    r.cancelled = cancelled;
    r.agents.reserve(w.agents.size());
    for (const auto &a : w.agents) {
        if (a.alive)
            (a.team == 1 ? r.team1_survivors : r.team2_survivors).push_back(a.id);
        AgentSummary s;
        s.id = a.id;
        s.name = a.name;
        s.team = a.team;
        s.chassis = a.chassis;
        s.plating = a.plating;
        s.weapon = a.weapon;
        s.behavior = a.behavior;
        s.target_priority = a.target_priority;
        s.engagement_range = a.engagement_range;
        s.projectile = a.projectile;
        s.archetype = a.archetype;
        s.min_range = a.min_range;
        s.max_range = a.max_range;
        s.is_healer = a.is_healer;
        s.allows_point_blank = a.allows_point_blank;
        s.final_health = a.health;
        s.max_health = a.max_health;
        s.damage_dealt = a.damage_dealt;
        s.damage_taken = a.damage_taken;
        s.kills = a.kills;
        s.survived = a.alive;
        r.agents.push_back(std::move(s));
    }
    r.frames = std::move(frames);
    return r;
}

} // namespace botarena::sim
