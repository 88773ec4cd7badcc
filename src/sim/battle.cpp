// SPDX-License-Identifier: Apache-2.0
#include "sim/battle.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/ai.hpp"
#include "sim/combat.hpp"
#include "sim/movement.hpp"
#include "sim/projectiles.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace botarena::sim {

namespace {
constexpr float kSpawnInset = 120.f;
constexpr float kMinRangeRadiusFactor = 2.5f;

const BattleConfig &checked(const BattleConfig &cfg)
{
    validate_battle_config(cfg);
    return cfg;
}
} // namespace

Battle::Battle(const BattleConfig &cfg, std::shared_ptr<CollisionProvider> oracle)
    : world_(checked(cfg))
    , oracle_(std::move(oracle))
    , fallback_(cfg.bot_radius)
{
    if (!oracle_)
        oracle_ = std::make_shared<CircleCollisionProvider>(cfg.bot_radius);
}

size_t Battle::add_agent(const AgentSpawnDescriptor &d)
{
    if (started_)
        throw std::logic_error("add_agent after the battle started");
    if (d.id.empty())
        throw std::invalid_argument("agent id is empty");
    if (d.team != 1 && d.team != 2)
        throw std::invalid_argument("agent " + d.id + ": team must be 1 or 2");
    if (d.max_health <= 0)
        throw std::invalid_argument("agent " + d.id + ": max_health must be positive");
    if (d.min_range < 0.f || d.max_range < 0.f)
        throw std::invalid_argument("agent " + d.id + ": negative range");
    for (const auto &a : world_.agents) {
        if (a.id == d.id)
            throw std::invalid_argument("duplicate agent id " + d.id);
    }
    const BattleConfig &cfg = world_.cfg;
    AgentState a;
    a.id = d.id;
    a.name = d.name.empty() ? d.id : d.name;
    a.team = d.team;
    a.chassis = d.chassis;
    a.plating = d.plating;
    a.weapon = d.weapon;
    a.max_health = d.max_health;
    a.health = d.max_health;
    a.speed = d.speed;
    a.rotation_speed = d.rotation_speed;
    a.turret_rotation_speed = d.turret_rotation_speed;
    a.intelligence = std::clamp(d.intelligence, 0, 10);
    a.agility = std::clamp(d.agility, 0.f, 1.f);
    a.damage_per_shot = d.damage_per_shot;
    a.shots_per_second = d.shots_per_minute / 60.f;
    a.is_healer = d.is_healer;
    a.muzzle_offset = d.muzzle_offset;
    a.allows_point_blank = d.min_range == 0.f;
    a.archetype = classify_weapon(d.min_range, d.max_range);
    a.min_range = static_cast<float>(static_cast<int>(d.min_range * cfg.range_scale));
    a.max_range = static_cast<float>(static_cast<int>(d.max_range * cfg.range_scale));
    a.min_range = std::max(a.min_range, static_cast<float>(static_cast<int>(cfg.bot_radius * kMinRangeRadiusFactor)));
    if (a.min_range > a.max_range && !a.allows_point_blank)
        log::warn("[battle] agent {} min_range {} exceeds max_range {} after scaling", a.id, a.min_range, a.max_range);
    a.behavior = d.behavior.value_or(default_behavior_for_chassis(d.chassis));
    a.target_priority = d.target_priority.value_or(TargetPriority::closest);
    a.engagement_range = d.engagement_range;
    a.projectile = d.projectile.value_or(d.is_healer ? ProjectileKind::heal : ProjectileKind::bullet);
    world_.agents.push_back(std::move(a));
    return world_.agents.size() - 1;
}

void Battle::setup_positions()
{
    const BattleConfig &cfg = world_.cfg;
    size_t n1 = 0, n2 = 0;
    for (const auto &a : world_.agents)
        (a.team == 1 ? n1 : n2)++;
    size_t i1 = 0, i2 = 0;
    for (auto &a : world_.agents) {
        if (a.team == 1) {
            float x = static_cast<float>(i1 + 1) * cfg.arena_width / static_cast<float>(n1 + 1);
            a.position = Vec2{x, kSpawnInset};
            a.orientation = 90.f;
            ++i1;
        } else {
            float x = static_cast<float>(i2 + 1) * cfg.arena_width / static_cast<float>(n2 + 1);
            a.position = Vec2{x, cfg.arena_height - kSpawnInset};
            a.orientation = 270.f;
            ++i2;
        }
        a.weapon_orientation = a.orientation;
        a.target_orientation = a.orientation;
    }
    positioned_ = true;
}

void Battle::place(size_t idx, Vec2 position, float orientation)
{
    AgentState &a = world_.agents.at(idx);
    a.position = position;
    a.orientation = wrap360(orientation);
    a.weapon_orientation = a.orientation;
    a.target_orientation = a.orientation;
    positioned_ = true;
}

void Battle::begin()
{
    if (!positioned_)
        setup_positions();
    started_ = true;
    frames_.reserve(static_cast<size_t>(std::min<uint64_t>(world_.cfg.max_frames(), 1u << 16)));
    metrics::inc(metrics::runtime().battles_started);
    size_t n1 = 0;
    for (const auto &a : world_.agents)
        n1 += a.team == 1 ? 1 : 0;
    log::info("[battle] start agents={} team1={} team2={} fps={} max_frames={} seed={}", world_.agents.size(), n1,
        world_.agents.size() - n1, world_.cfg.fps, world_.cfg.max_frames(), world_.cfg.seed);
}

bool Battle::termination_reached() const
{
    bool t1 = false, t2 = false;
    for (const auto &a : world_.agents) {
        if (!a.alive)
            continue;
        (a.team == 1 ? t1 : t2) = true;
    }
    return !t1 || !t2 || world_.frame >= world_.cfg.max_frames();
}

bool Battle::step()
{
    if (finished_ || over_)
        return true;
    if (!started_)
        begin();
    using clock = std::chrono::steady_clock;
    auto t0 = clock::now();
    World &w = world_;
    log::BattleScope scope(label_, static_cast<int64_t>(w.frame));
    w.events.clear();
    w.now = static_cast<double>(w.frame) / static_cast<double>(w.cfg.fps);

    if (auto ev = w.stalemate.update(w.now, w.agents, w.cfg))
        w.emit(*ev, kNoTarget, kNoTarget);

    update_targets(w);
    for (size_t i = 0; i < w.agents.size(); ++i) {
        if (!w.agents[i].alive)
            continue;
        MoveCommand cmd = decide(w, i);
        apply_movement(w.agents, i, cmd, w.cfg, w.now, w.dt);
    }
    for (auto &a : w.agents) {
        if (a.alive)
            track_turret(a, w.target_of(a), w.dt);
    }
    update_projectiles(w, *oracle_, fallback_);
    update_combat(w);

    frames_.push_back(capture_frame(w));
    ++w.frame;
    over_ = termination_reached();

    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - t0).count();
    metrics::add_tick_duration(static_cast<uint64_t>(ns));
    return over_;
}

BattleResult Battle::finish(bool cancelled)
{
    if (finished_)
        throw std::logic_error("battle already finished");
    finished_ = true;
    BattleResult r = build_result(world_, std::move(frames_), cancelled);
    frames_.clear();
    if (cancelled)
        metrics::inc(metrics::runtime().battles_cancelled);
    else
        metrics::inc(metrics::runtime().battles_finished);
    log::info("[battle] end winner_team={} frames={} duration={}s cancelled={} survivors={}/{}", r.winner_team,
        r.total_frames, r.duration, r.cancelled, r.team1_survivors.size(), r.team2_survivors.size());
    return r;
}

BattleResult Battle::run(const std::atomic_bool *cancel)
{
    bool cancelled = false;
    while (true) {
        if (cancel && cancel->load()) {
            cancelled = true;
            break;
        }
        if (step())
            break;
    }
    return finish(cancelled);
}

coro::task<void> run_battle(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BattleContext> ctx)
{
    co_await scheduler->schedule();
    if (ctx->battle->label().empty())
        ctx->battle->set_label(ctx->battle_id);
    log::debug("[battle] runner start id={}", ctx->battle_id);
    uint32_t every = std::max<uint32_t>(1, ctx->battle->world().cfg.yield_every_ticks);
    uint32_t since_yield = 0;
    bool cancelled = false;
    while (true) {
        if (ctx->cancel.load()) {
            cancelled = true;
            break;
        }
        if (ctx->battle->step())
            break;
        if (++since_yield >= every) {
            since_yield = 0;
            co_await scheduler->schedule();
        }
    }
    ctx->result = ctx->battle->finish(cancelled);
    ctx->done.store(true);
    log::debug("[battle] runner end id={} cancelled={}", ctx->battle_id, cancelled);
    co_return;
}

} // namespace botarena::sim
