// SPDX-License-Identifier: Apache-2.0
// unit_replay.cpp
// BattleResult -> protobuf BattleReplay -> BattleResult, and rejection of malformed replays (unknown enums,
// out-of-range stats, frame and event indexes).
#include "battle.pb.h"
#include "sim/replay.hpp"
#include "test_battle_fixtures.hpp"

#include <cassert>
#include <iostream>

using namespace botarena::sim;
using botarena::test::fast_config;
using botarena::test::make_unit;

static BattleResult short_battle()
{
    Battle b(fast_config(3.f));
    b.add_agent(make_unit("red", 1));
    auto medic = make_unit("red-medic", 1);
    medic.is_healer = true;
    b.add_agent(medic);
    b.add_agent(make_unit("blue", 2));
    return b.run();
}

static void test_parse_back()
{
    BattleResult r = short_battle();
    assert(r.total_frames == 90);
    std::string bytes = serialize_replay(r);
    assert(!bytes.empty());
    auto back = parse_replay(bytes);
    assert(back);
    assert(back->winner_team == r.winner_team);
    assert(back->total_frames == r.total_frames);
    assert(back->duration == r.duration);
    assert(back->cancelled == r.cancelled);
    assert(back->config.seed == r.config.seed && back->config.fps == r.config.fps);
    assert(back->team1_survivors == r.team1_survivors && back->team2_survivors == r.team2_survivors);
    assert(back->agents.size() == 3);
    for (size_t i = 0; i < r.agents.size(); ++i) {
        const auto &a = r.agents[i];
        const auto &b = back->agents[i];
        assert(a.id == b.id && a.team == b.team && a.behavior == b.behavior);
        assert(a.projectile == b.projectile && a.archetype == b.archetype);
        assert(a.min_range == b.min_range && a.max_range == b.max_range);
        assert(a.final_health == b.final_health && a.damage_dealt == b.damage_dealt && a.kills == b.kills);
    }
    assert(back->find("red-medic") && back->find("red-medic")->projectile == ProjectileKind::heal);
    assert(back->frames.size() == r.frames.size());
    for (size_t i = 0; i < r.frames.size(); ++i) {
        const auto &f = r.frames[i];
        const auto &g = back->frames[i];
        assert(f.frame == g.frame && f.time == g.time && f.stalemate == g.stalemate);
        assert(f.agents == g.agents);
        assert(f.projectiles == g.projectiles);
        assert(f.events.size() == g.events.size());
        for (size_t e = 0; e < f.events.size(); ++e)
            assert(f.events[e].kind == g.events[e].kind && f.events[e].amount == g.events[e].amount);
    }
    // a parsed replay serializes to the same bytes
    assert(serialize_replay(*back) == bytes);
}

static void test_rejects()
{
    BattleResult r = short_battle();
    botarena::BattleReplay msg = to_replay(r);
    assert(msg.agents_size() == 3 && msg.stats_size() == 3);

    botarena::BattleReplay bad_enum = msg;
    bad_enum.mutable_agents(0)->set_behavior("coward");
    assert(!from_replay(bad_enum));

    botarena::BattleReplay bad_index = msg;
    bad_index.mutable_stats(1)->set_index(42);
    assert(!from_replay(bad_index));

    botarena::BattleReplay bad_frame_agent = msg;
    bad_frame_agent.mutable_frames(5)->mutable_agents(2)->set_index(9);
    assert(!from_replay(bad_frame_agent));

    botarena::BattleReplay missing_agent = msg;
    missing_agent.mutable_frames(0)->mutable_agents()->RemoveLast();
    assert(!from_replay(missing_agent));

    botarena::BattleReplay dangling_target = msg;
    dangling_target.mutable_frames(1)->mutable_agents(0)->set_target(3);
    assert(!from_replay(dangling_target));

    botarena::BattleReplay dangling_actor = msg;
    auto *ev = dangling_actor.mutable_frames(2)->add_events();
    ev->set_kind(botarena::EVENT_HIT);
    ev->set_actor(0);
    ev->set_subject(17);
    assert(!from_replay(dangling_actor));

    botarena::BattleReplay unknown_kind = msg;
    auto *odd = unknown_kind.mutable_frames(2)->add_events();
    odd->set_kind(static_cast<botarena::EventKind>(42));
    assert(!from_replay(unknown_kind));

    botarena::BattleReplay unknown_state = msg;
    unknown_state.mutable_frames(3)->set_stalemate(static_cast<botarena::StalemateState>(7));
    assert(!from_replay(unknown_state));

    botarena::BattleReplay bad_projectile = msg;
    auto *proj = bad_projectile.mutable_frames(4)->add_projectiles();
    proj->set_shooter(-5);
    assert(!from_replay(bad_projectile));

    // a well-formed added event is accepted
    botarena::BattleReplay extra_event = msg;
    auto *ok = extra_event.mutable_frames(2)->add_events();
    ok->set_kind(botarena::EVENT_STALEMATE_ENGAGED);
    ok->set_actor(-1);
    ok->set_subject(-1);
    ok->set_intended(-1);
    assert(from_replay(extra_event));

    assert(from_replay(msg));
}

int main()
{
    test_parse_back();
    test_rejects();
    std::cout << "unit_replay OK" << std::endl;
    return 0;
}
