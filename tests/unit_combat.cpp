// SPDX-License-Identifier: Apache-2.0
// unit_combat.cpp
// Fire gating (cooldown, range band, aim cone, line of fire), projectile spawn at the muzzle and point-blank
// direct resolution with its visual-only burst.
#include "sim/combat.hpp"
#include "test_battle_fixtures.hpp"

#include <cassert>
#include <iostream>

using namespace botarena::sim;
using botarena::test::make_state;
using botarena::test::near;

// shooter 0 at (300,500) facing east, target 1 at `target_x`
static World range_setup(float target_x)
{
    World w{BattleConfig{}};
    w.agents.push_back(make_state("a", 1, Vec2{300.f, 500.f}, 0.f));
    w.agents.push_back(make_state("b", 2, Vec2{target_x, 500.f}, 180.f));
    w.agents[0].target = 1;
    w.agents[0].shots_per_second = 1.f;
    w.agents[0].damage_per_shot = 10;
    w.now = 1.0;
    return w;
}

static void test_projectile_spawn()
{
    World w = range_setup(500.f);
    assert(try_fire(w, 0));
    assert(w.projectiles.size() == 1);
    const Projectile &p = w.projectiles.front();
    assert(near(p.position.x, 350.f) && near(p.position.y, 500.f));
    assert(near(p.velocity.x, 500.f) && near(p.velocity.y, 0.f));
    assert(p.damage == 10 && !p.heal && !p.visual_only && p.ttl < 0.f);
    assert(p.shooter == 0 && p.target == 1);
    assert(w.events.size() == 1 && w.events[0].kind == EventKind::shot);
    assert(w.agents[0].last_shot_time == 1.0);
    // cooldown
    assert(!try_fire(w, 0));
    w.now = 1.99;
    assert(!try_fire(w, 0));
    w.now = 2.0;
    assert(try_fire(w, 0));
    assert(w.projectiles.back().id == w.projectiles.front().id + 1);

    World laser = range_setup(500.f);
    laser.agents[0].projectile = ProjectileKind::laser;
    assert(try_fire(laser, 0));
    assert(near(laser.projectiles.front().velocity.x, 1000.f));
}

static void test_gates()
{
    World far = range_setup(560.f);
    assert(!try_fire(far, 0)); // 260 > max_range
    World close = range_setup(350.f);
    assert(!try_fire(close, 0)); // inside min_range, no point-blank

    World cone = range_setup(500.f);
    cone.agents[0].weapon_orientation = 41.f; // cone is 10 + 10 * 3
    assert(!try_fire(cone, 0));
    cone.agents[0].weapon_orientation = 39.f;
    assert(try_fire(cone, 0));

    World dead = range_setup(500.f);
    dead.agents[1].alive = false;
    dead.agents[1].health = 0;
    assert(!try_fire(dead, 0));

    World idle = range_setup(500.f);
    idle.agents[0].shots_per_second = 0.f;
    assert(!try_fire(idle, 0));
}

static void test_line_of_fire()
{
    World w = range_setup(500.f);
    w.agents.push_back(make_state("friend", 1, Vec2{400.f, 510.f}));
    assert(friendly_in_line_of_fire(w, 0, 1));
    assert(!try_fire(w, 0));
    assert(w.projectiles.empty());

    // a teammate behind the target does not block
    w.agents[2].position = Vec2{600.f, 500.f};
    assert(!friendly_in_line_of_fire(w, 0, 1));
    // nor one well off the line
    w.agents[2].position = Vec2{400.f, 560.f};
    assert(!friendly_in_line_of_fire(w, 0, 1));

    // healers ignore the rule
    World h = range_setup(500.f);
    h.agents[1].team = 1;
    h.agents[1].health = 50;
    h.agents[0].is_healer = true;
    h.agents.push_back(make_state("friend", 1, Vec2{400.f, 500.f}));
    assert(try_fire(h, 0));
}

static void test_point_blank()
{
    World w = range_setup(370.f);
    AgentState &a = w.agents[0];
    a.allows_point_blank = true;
    a.muzzle_offset = 100.f;
    assert(try_fire(w, 0));
    assert(w.agents[1].health == 90);
    assert(w.agents[0].damage_dealt == 10);
    assert(w.stalemate.last_damage_time() == 1.0);
    assert(w.projectiles.size() == 1);
    const Projectile &p = w.projectiles.front();
    assert(p.visual_only && p.velocity.x == 0.f && p.velocity.y == 0.f);
    assert(near(p.ttl, kPointBlankFxSeconds));
    assert(near(p.position.x, 370.f));
    assert(w.events.size() == 2);
    assert(w.events[0].kind == EventKind::shot);
    assert(w.events[1].kind == EventKind::hit && w.events[1].amount == 10 && w.events[1].subject == 1);

    // lethal point-blank shot credits the kill
    World k = range_setup(370.f);
    k.agents[0].allows_point_blank = true;
    k.agents[0].muzzle_offset = 100.f;
    k.agents[1].health = 5;
    assert(try_fire(k, 0));
    assert(!k.agents[1].alive && k.agents[1].health == 0);
    assert(k.agents[0].kills == 1);
    assert(k.agents[0].damage_dealt == 5);
    assert(k.events.back().kind == EventKind::kill);

    // point-blank weapon but target beyond the muzzle: ordinary projectile
    World pb = range_setup(500.f);
    pb.agents[0].allows_point_blank = true;
    assert(try_fire(pb, 0));
    assert(!pb.projectiles.front().visual_only);
    assert(pb.agents[1].health == 100);
}

static void test_heal_resolution()
{
    World w = range_setup(500.f);
    w.agents[1].team = 1;
    w.agents[1].health = 95;
    int32_t restored = resolve_heal(w, 0, 1, 10, 7);
    assert(restored == 5 && w.agents[1].health == 100);
    assert(w.agents[0].damage_dealt == 5);
    assert(w.events.back().kind == EventKind::heal && w.events.back().projectile_id == 7);
    // no heal beyond max, none for the dead
    assert(resolve_heal(w, 0, 1, 10, 8) == 0);
    w.agents[1].health = 0;
    w.agents[1].alive = false;
    assert(resolve_heal(w, 0, 1, 10, 9) == 0);
}

int main()
{
    test_projectile_spawn();
    test_gates();
    test_line_of_fire();
    test_point_blank();
    test_heal_resolution();
    std::cout << "unit_combat OK" << std::endl;
    return 0;
}
