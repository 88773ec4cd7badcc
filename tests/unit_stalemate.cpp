// SPDX-License-Identifier: Apache-2.0
// unit_stalemate.cpp
// No-damage escalation: Normal -> Stalemate at 3 s, Dispersal at 9 s only under corner-lock, 6 s dispersal
// timeout, and damage resets.
#include "sim/stalemate.hpp"
#include "test_battle_fixtures.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace botarena::sim;
using botarena::test::make_state;

static std::vector<AgentState> open_field()
{
    return {make_state("a", 1, Vec2{300.f, 500.f}), make_state("b", 2, Vec2{700.f, 500.f})};
}

static std::vector<AgentState> pinned_to_walls()
{
    return {make_state("a", 1, Vec2{72.f, 500.f}), make_state("b", 2, Vec2{928.f, 500.f})};
}

static void test_corner_lock()
{
    BattleConfig cfg;
    assert(!detect_corner_lock(open_field(), cfg));
    assert(detect_corner_lock(pinned_to_walls(), cfg));
    auto one_wall = pinned_to_walls();
    one_wall[1].position = Vec2{500.f, 500.f};
    assert(!detect_corner_lock(one_wall, cfg));
    auto dead = pinned_to_walls();
    dead[1].alive = false;
    dead[1].health = 0;
    assert(!detect_corner_lock(dead, cfg));

    // enemies mutually inside each other's min range
    std::vector<AgentState> crowd{make_state("a", 1, Vec2{500.f, 500.f}), make_state("b", 2, Vec2{560.f, 500.f})};
    assert(detect_corner_lock(crowd, cfg));
    crowd[1].allows_point_blank = true;
    assert(!detect_corner_lock(crowd, cfg));
    crowd[1].allows_point_blank = false;
    crowd[1].team = 1;
    assert(!detect_corner_lock(crowd, cfg));
}

static void test_escalation()
{
    BattleConfig cfg;
    StalemateMonitor m;
    auto field = open_field();
    auto pinned = pinned_to_walls();
    assert(!m.update(2.9, field, cfg));
    assert(m.state() == StalemateState::normal);
    auto ev = m.update(3.0, field, cfg);
    assert(ev && *ev == EventKind::stalemate_engaged);
    assert(m.stalemate_engaged());
    // no event while the state holds
    assert(!m.update(3.1, field, cfg));

    // without corner-lock dispersal never starts
    assert(!m.update(12.0, field, cfg));
    assert(m.stalemate_engaged());
    ev = m.update(12.1, pinned, cfg);
    assert(ev && *ev == EventKind::dispersal_engaged);
    assert(m.dispersal_engaged() && m.dispersal_started() == 12.1);

    // damage during dispersal resets the clock but dispersal keeps counting down
    m.on_enemy_damage(13.0);
    assert(m.dispersal_engaged());
    assert(!m.update(18.0, pinned, cfg));
    assert(m.dispersal_engaged());
    assert(!m.update(18.1, pinned, cfg));
    assert(m.state() == StalemateState::normal);
    // quiet since 13.0: the ordinary rule re-engages
    ev = m.update(18.2, pinned, cfg);
    assert(ev && *ev == EventKind::stalemate_engaged);
}

static void test_damage_clears()
{
    BattleConfig cfg;
    StalemateMonitor m;
    auto field = open_field();
    assert(m.update(3.0, field, cfg));
    m.on_enemy_damage(3.5);
    assert(m.state() == StalemateState::normal);
    assert(m.last_damage_time() == 3.5);
    assert(!m.update(6.4, field, cfg));
    assert(m.update(6.5, field, cfg));
    // exact tick boundaries derived from frame / fps
    StalemateMonitor t;
    double now = 90.0 / 30.0;
    assert(t.update(now, field, cfg));
}

static void test_custom_tuning()
{
    BattleConfig cfg;
    StalemateMonitor m(StalemateTuning{1.0, 2.0, 0.5});
    auto pinned = pinned_to_walls();
    assert(m.update(1.0, pinned, cfg));
    assert(m.update(2.0, pinned, cfg));
    assert(!m.update(2.5, pinned, cfg));
    assert(m.state() == StalemateState::normal);
    assert(std::string(stalemate_state_name(m.state())) == "normal");
}

int main()
{
    test_corner_lock();
    test_escalation();
    test_damage_clears();
    test_custom_tuning();
    std::cout << "unit_stalemate OK" << std::endl;
    return 0;
}
