// SPDX-License-Identifier: Apache-2.0
// unit_movement.cpp
// Turn penalties, concurrent turn-and-move, arena clamping with wall-escape bookkeeping, pairwise move
// rejection and turret tracking.
#include "sim/movement.hpp"
#include "test_battle_fixtures.hpp"

#include <cassert>
#include <iostream>
#include <vector>

using namespace botarena::sim;
using botarena::test::make_state;
using botarena::test::near;

static const double kDt = 1.0 / 30.0;

static void test_effective_speed()
{
    assert(near(effective_speed(0.f, 1.f, 0.5f), 1.f));
    assert(near(effective_speed(90.f, 1.f, 0.5f), 0.5f));
    assert(near(effective_speed(-45.f, 1.f, 0.5f), 0.75f));
    // low agility sharp turn
    assert(near(effective_speed(90.f, 1.f, 0.f), 0.15f));
    // facing away
    assert(near(effective_speed(150.f, 1.f, 0.8f), 0.4f));
    assert(near(effective_speed(150.f, 1.f, 0.2f), 0.2f));
    // floor never lifts a small command above itself
    assert(near(effective_speed(60.f, 0.1f, 0.5f), 0.1f));
    assert(near(effective_speed(89.f, 1.f, 0.3f), 0.3f + 0.7f * (1.f - 89.f / 90.f), 1e-4));
    assert(effective_speed(45.f, 0.f, 0.5f) == 0.f);
}

static void test_straight_and_turning()
{
    BattleConfig cfg;
    std::vector<AgentState> agents{make_state("a", 1, Vec2{500.f, 500.f}, 0.f)};
    agents[0].speed = 100.f;
    agents[0].rotation_speed = 90.f;
    assert(apply_movement(agents, 0, MoveCommand{0.f, 1.f}, cfg, 0.0, kDt));
    assert(near(agents[0].position.x, 500.f + 100.f / 30.f));
    assert(near(agents[0].position.y, 500.f));
    assert(near(agents[0].velocity.x, 100.f, 1e-2));
    assert(!agents[0].turning);

    // turn and move in the same tick, along the new orientation
    assert(apply_movement(agents, 0, MoveCommand{90.f, 1.f}, cfg, kDt, kDt));
    float expected_orientation = 94.f / 30.f;
    assert(near(agents[0].orientation, expected_orientation, 1e-3));
    assert(agents[0].turning);
    assert(near(agents[0].target_orientation, 90.f));
    assert(agents[0].position.y > 500.f);
    assert(agents[0].position.x > 500.f + 100.f / 30.f);
}

static void test_wall_clamp()
{
    BattleConfig cfg;
    std::vector<AgentState> agents{make_state("a", 1, Vec2{73.f, 500.f}, 180.f)};
    agents[0].speed = 100.f;
    assert(apply_movement(agents, 0, MoveCommand{180.f, 1.f}, cfg, 2.0, kDt));
    const float lo = cfg.bot_radius + kArenaBuffer;
    assert(near(agents[0].position.x, lo));
    assert(agents[0].wall_escape_timer == kWallEscapeSeconds);
    assert(agents[0].last_wall_contact == 2.0);
    assert(against_wall(agents[0].position, cfg));
    Vec2 push = wall_escape_vector(agents[0].position, cfg);
    assert(push.x == 1.f && push.y == 0.f);
    Vec2 corner = wall_escape_vector(Vec2{960.f, 960.f}, cfg);
    assert(corner.x == -1.f && corner.y == -1.f);
    assert(!against_wall(Vec2{500.f, 500.f}, cfg));
}

static void test_pairwise_reject()
{
    BattleConfig cfg;
    std::vector<AgentState> agents{
        make_state("a", 1, Vec2{500.f, 500.f}, 0.f), make_state("b", 2, Vec2{572.f, 500.f}, 180.f)};
    agents[0].speed = 100.f;
    assert(!apply_movement(agents, 0, MoveCommand{0.f, 1.f}, cfg, 0.0, kDt));
    assert(agents[0].position.x == 500.f);
    assert(agents[0].velocity.x == 0.f && agents[0].velocity.y == 0.f);

    // dead agents do not block
    agents[1].alive = false;
    agents[1].health = 0;
    assert(apply_movement(agents, 0, MoveCommand{0.f, 1.f}, cfg, 0.0, kDt));

    // already overlapping: only strictly separating moves pass
    std::vector<AgentState> tight{
        make_state("a", 1, Vec2{500.f, 500.f}, 180.f), make_state("b", 2, Vec2{550.f, 500.f}, 0.f)};
    tight[0].speed = 100.f;
    assert(apply_movement(tight, 0, MoveCommand{180.f, 1.f}, cfg, 0.0, kDt));
    assert(tight[0].position.x < 500.f);
    tight[0].orientation = 0.f;
    Vec2 before = tight[0].position;
    assert(!apply_movement(tight, 0, MoveCommand{0.f, 1.f}, cfg, 0.0, kDt));
    assert(tight[0].position.x == before.x);
}

static void test_turret()
{
    AgentState a = make_state("a", 1, Vec2{0.f, 0.f}, 0.f);
    a.turret_rotation_speed = 30.f;
    AgentState t = make_state("t", 2, Vec2{0.f, 100.f});
    track_turret(a, &t, kDt);
    assert(near(a.weapon_orientation, 1.f, 1e-4));
    for (int i = 0; i < 120; ++i)
        track_turret(a, &t, kDt);
    assert(near(a.weapon_orientation, 90.f, 1e-3));
    // no target: follows the chassis
    a.orientation = 80.f;
    track_turret(a, nullptr, kDt);
    assert(near(a.weapon_orientation, 89.f, 1e-3));
    t.alive = false;
    track_turret(a, &t, kDt);
    assert(near(a.weapon_orientation, 88.f, 1e-3));
}

int main()
{
    test_effective_speed();
    test_straight_and_turning();
    test_wall_clamp();
    test_pairwise_reject();
    test_turret();
    std::cout << "unit_movement OK" << std::endl;
    return 0;
}
