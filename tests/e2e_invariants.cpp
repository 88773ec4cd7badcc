// SPDX-License-Identifier: Apache-2.0
// e2e_invariants.cpp
// Runs the squad roster for a full minute and checks per-frame invariants: health bounds, alive flag,
// arena clamp, pairwise separation, the min-range hit bound, projectile containment, frame clock, and event/stat bookkeeping.
#include "sim/battle.hpp"
#include "test_battle_fixtures.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace botarena;

int main()
{
    sim::BattleConfig bc = test::fast_config(60.f);
    bc.seed = 3;
    cfg::Roster roster = cfg::load_roster(test::source_path("config/roster_squad.yaml"));
    sim::Battle battle(bc);
    for (const auto &d : roster.agents)
        battle.add_agent(d);
    sim::BattleResult r = battle.run();

    assert(r.total_frames == r.frames.size());
    assert(r.total_frames >= 1 && r.total_frames <= bc.max_frames());
    assert(r.duration == static_cast<double>(r.total_frames) / bc.fps);
    assert(!r.cancelled);

    const float lo = bc.bot_radius + 40.f;
    const float hi_x = bc.arena_width - lo;
    const float hi_y = bc.arena_height - lo;
    const float min_sep = bc.bot_radius * 2.2f;
    const size_t n = r.agents.size();
    std::vector<int64_t> dealt(n, 0), taken(n, 0), kills(n, 0);
    std::vector<bool> was_dead(n, false);
    std::vector<sim::AgentView> last(n);

    for (size_t fi = 0; fi < r.frames.size(); ++fi) {
        const auto &f = r.frames[fi];
        assert(f.frame == fi);
        assert(f.time == static_cast<double>(fi) / static_cast<double>(bc.fps));
        assert(f.agents.size() == n);
        for (size_t i = 0; i < n; ++i) {
            const auto &a = f.agents[i];
            assert(a.index == i);
            assert(a.health >= 0 && a.health <= r.agents[i].max_health);
            assert(a.alive == (a.health > 0));
            assert(a.x >= lo - 1e-3f && a.x <= hi_x + 1e-3f);
            assert(a.y >= lo - 1e-3f && a.y <= hi_y + 1e-3f);
            // the dead stay dead and stay put
            if (was_dead[i]) {
                assert(!a.alive);
                assert(a.x == last[i].x && a.y == last[i].y);
            }
            was_dead[i] = !a.alive;
            last[i] = a;
            if (!a.alive)
                continue;
            for (size_t j = i + 1; j < n; ++j) {
                const auto &b = f.agents[j];
                if (!b.alive)
                    continue;
                float d = b2Distance(sim::Vec2{a.x, a.y}, sim::Vec2{b.x, b.y});
                assert(d >= min_sep - 1e-2f);
            }
        }
        for (const auto &p : f.projectiles) {
            assert(p.x >= 0.f && p.x <= bc.arena_width && p.y >= 0.f && p.y <= bc.arena_height);
            if (p.visual_only)
                assert(p.vx == 0.f && p.vy == 0.f && p.ttl > 0.f);
        }
        for (const auto &e : f.events) {
            switch (e.kind) {
                case sim::EventKind::hit: {
                    const auto &shooter = r.agents[static_cast<size_t>(e.actor)];
                    assert(shooter.team != r.agents[static_cast<size_t>(e.subject)].team);
                    if (!shooter.allows_point_blank) {
                        // positions do not change between impact resolution and frame capture
                        const auto &sa = f.agents[static_cast<size_t>(e.actor)];
                        const auto &va = f.agents[static_cast<size_t>(e.subject)];
                        float d = b2Distance(sim::Vec2{sa.x, sa.y}, sim::Vec2{va.x, va.y});
                        assert(d >= shooter.min_range * 0.95f - 1e-3f);
                    }
                    dealt[static_cast<size_t>(e.actor)] += e.amount;
                    taken[static_cast<size_t>(e.subject)] += e.amount;
                    break;
                }
                case sim::EventKind::heal:
                    assert(r.agents[static_cast<size_t>(e.actor)].is_healer);
                    assert(e.amount >= 0);
                    dealt[static_cast<size_t>(e.actor)] += e.amount;
                    break;
                case sim::EventKind::blocked:
                    assert(r.agents[static_cast<size_t>(e.actor)].team == r.agents[static_cast<size_t>(e.subject)].team);
                    taken[static_cast<size_t>(e.subject)] += e.amount;
                    break;
                case sim::EventKind::kill:
                    ++kills[static_cast<size_t>(e.actor)];
                    break;
                case sim::EventKind::shot:
                case sim::EventKind::stalemate_engaged:
                case sim::EventKind::dispersal_engaged:
                    break;
            }
        }
    }

    for (size_t i = 0; i < n; ++i) {
        const auto &s = r.agents[i];
        assert(dealt[i] == s.damage_dealt);
        assert(taken[i] == s.damage_taken);
        assert(kills[i] == s.kills);
        assert(s.survived == (s.final_health > 0));
        assert(s.final_health == r.frames.back().agents[i].health);
    }

    // the outcome matches the survivor lists
    if (r.winner_team == 1)
        assert(!r.team1_survivors.empty() && r.team2_survivors.empty());
    else if (r.winner_team == 2)
        assert(r.team1_survivors.empty() && !r.team2_survivors.empty());
    else
        assert(r.team1_survivors.empty() == r.team2_survivors.empty());
    if (r.total_frames < bc.max_frames())
        assert(r.team1_survivors.empty() || r.team2_survivors.empty());

    std::cout << "e2e_invariants OK" << std::endl;
    return 0;
}
