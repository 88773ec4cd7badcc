// SPDX-License-Identifier: Apache-2.0
// unit_collision_mask.cpp
// Alpha thresholding, rotation on an expanded canvas, 360 degree periodicity, the rotated-mask LRU (keyed per
// plating and angle) and point queries (including the unavailable result for unknown platings).
#include "common/metrics.hpp"
#include "sim/collision.hpp"

#include <cassert>
#include <iostream>

using namespace botarena::sim;

static AlphaBitmap solid_bitmap(uint32_t w, uint32_t h, uint8_t alpha = 255)
{
    AlphaBitmap b;
    b.width = w;
    b.height = h;
    b.alpha.assign(static_cast<size_t>(w) * h, alpha);
    return b;
}

static void test_threshold()
{
    auto m = CollisionMask::from_alpha(solid_bitmap(20, 10));
    assert(m.width() == 20 && m.height() == 10);
    assert(m.solid_count() == 200);
    assert(CollisionMask::from_alpha(solid_bitmap(4, 4, 128)).solid_count() == 0);
    assert(CollisionMask::from_alpha(solid_bitmap(4, 4, 129)).solid_count() == 16);
    assert(!m.solid(-1, 0) && !m.solid(20, 0) && m.solid(19, 9));
}

static void test_quantize()
{
    assert(quantize_angle(0.f) == 0);
    assert(quantize_angle(2.4f) == 0);
    assert(quantize_angle(2.6f) == 5);
    assert(quantize_angle(357.6f) == 0);
    assert(quantize_angle(-3.f) == 355);
    assert(quantize_angle(397.f) == 35);
}

static void test_rotation()
{
    auto m = CollisionMask::from_alpha(solid_bitmap(20, 10));
    assert(m.rotated(0.f) == m);
    auto r90 = m.rotated(90.f);
    assert(r90.width() == 10 && r90.height() == 20);
    assert(r90.solid_count() == 200);
    // canvas grows for off-axis angles
    auto r45 = m.rotated(45.f);
    assert(r45.width() > 20 && r45.height() > 10);
    assert(r45.solid_count() > 0);
    // periodicity and quantization
    assert(m.rotated(37.f) == m.rotated(397.f));
    assert(m.rotated(37.f) == m.rotated(35.f));
    assert(m.rotated(-90.f) == m.rotated(270.f));
}

static void test_lru()
{
    BitmapCollisionProvider p(2);
    p.register_plating("hull", solid_bitmap(20, 10));
    assert(p.has_plating("hull") && !p.has_plating("other"));
    auto a = p.rotated_mask("hull", 0.f);
    auto b = p.rotated_mask("hull", 5.f);
    auto c = p.rotated_mask("hull", 10.f);
    assert(a && b && c);
    auto s = p.stats();
    assert(s.misses == 3 && s.hits == 0 && s.evictions == 1 && s.cached == 2);
    auto c2 = p.rotated_mask("hull", 11.f);
    assert(c2 == c);
    assert(p.stats().hits == 1);
    p.rotated_mask("hull", 0.f);
    s = p.stats();
    assert(s.misses == 4 && s.evictions == 2 && s.cached == 2);
    // masks handed out earlier survive eviction
    assert(a->solid_count() == 200);
    assert(botarena::metrics::get(botarena::metrics::runtime().mask_cache_evictions) >= 2);
    // re-registration drops stale rotations
    p.register_plating("hull", solid_bitmap(4, 4));
    assert(p.stats().cached == 0);
    assert(p.rotated_mask("hull", 0.f)->width() == 4);
}

static void test_reregister_keeps_other_platings()
{
    // plating ids that share a prefix with another id plus a separator keep their rotations
    BitmapCollisionProvider p(8);
    p.register_plating("a", solid_bitmap(20, 10));
    p.register_plating("a#1", solid_bitmap(6, 6));
    p.register_plating("a_b", solid_bitmap(8, 8));
    auto keep = p.rotated_mask("a#1", 5.f);
    p.rotated_mask("a_b", 0.f);
    p.rotated_mask("a", 0.f);
    p.rotated_mask("a", 90.f);
    assert(p.stats().cached == 4);

    p.register_plating("a", solid_bitmap(4, 4));
    assert(p.stats().cached == 2);
    auto misses = p.stats().misses;
    assert(p.rotated_mask("a#1", 5.f) == keep);
    p.rotated_mask("a_b", 0.f);
    assert(p.stats().misses == misses);
    assert(p.rotated_mask("a", 90.f)->width() == 4);
}

static void test_point_queries()
{
    BitmapCollisionProvider p;
    p.register_plating("hull", solid_bitmap(20, 10));
    const Vec2 c{100.f, 100.f};
    assert(p.test_point("hull", c, 0.f, Vec2{100.f, 100.f}) == HitTest::hit);
    assert(p.test_point("hull", c, 0.f, Vec2{109.f, 100.f}) == HitTest::hit);
    assert(p.test_point("hull", c, 0.f, Vec2{111.f, 100.f}) == HitTest::miss);
    assert(p.test_point("hull", c, 0.f, Vec2{100.f, 106.f}) == HitTest::miss);
    // turned 90 degrees the long axis points along +y
    assert(p.test_point("hull", c, 90.f, Vec2{100.f, 109.f}) == HitTest::hit);
    assert(p.test_point("hull", c, 90.f, Vec2{109.f, 100.f}) == HitTest::miss);
    assert(p.test_point("missing", c, 0.f, c) == HitTest::unavailable);
    assert(p.rotated_mask("missing", 0.f) == nullptr);

    BitmapCollisionProvider big(16, 2.f);
    big.register_plating("hull", solid_bitmap(20, 10));
    assert(big.test_point("hull", c, 0.f, Vec2{115.f, 100.f}) == HitTest::hit);
    assert(big.test_point("hull", c, 0.f, Vec2{121.f, 100.f}) == HitTest::miss);

    CircleCollisionProvider circle(32.f);
    assert(circle.test_point("any", c, 0.f, Vec2{131.f, 100.f}) == HitTest::hit);
    assert(circle.test_point("any", c, 0.f, Vec2{133.f, 100.f}) == HitTest::miss);
}

int main()
{
    test_threshold();
    test_quantize();
    test_rotation();
    test_lru();
    test_reregister_keeps_other_platings();
    test_point_queries();
    std::cout << "unit_collision_mask OK" << std::endl;
    return 0;
}
