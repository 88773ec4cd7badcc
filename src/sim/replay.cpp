// SPDX-License-Identifier: Apache-2.0
#include "sim/replay.hpp"

#include "common/logger.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace botarena::sim {

namespace {

std::optional<WeaponArchetype> parse_archetype(std::string_view s)
{
    for (auto w : {WeaponArchetype::brawler, WeaponArchetype::skirmisher, WeaponArchetype::rifle,
             WeaponArchetype::sniper}) {
        if (s == weapon_archetype_name(w))
            return w;
    }
    return std::nullopt;
}

void fill_frame(botarena::ReplayFrame &out, const FrameSnapshot &f)
{
    out.set_frame(f.frame);
    out.set_time(f.time);
    out.set_stalemate(static_cast<botarena::StalemateState>(f.stalemate));
    for (const auto &a : f.agents) {
        auto *m = out.add_agents();
        m->set_index(a.index);
        m->set_x(a.x);
        m->set_y(a.y);
        m->set_vx(a.vx);
        m->set_vy(a.vy);
        m->set_orientation(a.orientation);
        m->set_weapon_orientation(a.weapon_orientation);
        m->set_health(a.health);
        m->set_alive(a.alive);
        m->set_target(a.target);
        m->set_turning(a.turning);
    }
    for (const auto &p : f.projectiles) {
        auto *m = out.add_projectiles();
        m->set_id(p.id);
        m->set_shooter(p.shooter);
        m->set_target(p.target);
        m->set_x(p.x);
        m->set_y(p.y);
        m->set_vx(p.vx);
        m->set_vy(p.vy);
        m->set_damage(p.damage);
        m->set_heal(p.heal);
        m->set_visual_only(p.visual_only);
        m->set_kind(static_cast<botarena::ProjectileKind>(p.kind));
        m->set_ttl(p.ttl);
    }
    for (const auto &e : f.events) {
        auto *m = out.add_events();
        m->set_kind(static_cast<botarena::EventKind>(e.kind));
        m->set_actor(e.actor);
        m->set_subject(e.subject);
        m->set_intended(e.intended);
        m->set_amount(e.amount);
        m->set_projectile_id(e.projectile_id);
    }
}

// An agent reference in a frame: kNoTarget or an index into the roster.
bool valid_ref(int32_t ref, size_t agents)
{
    return ref == kNoTarget || (ref >= 0 && static_cast<size_t>(ref) < agents);
}

// Rejects frames whose agent list does not match the roster, dangling agent references and enum values this
// build does not know.
std::optional<FrameSnapshot> read_frame(const botarena::ReplayFrame &m, size_t agents)
{
    FrameSnapshot f;
    f.frame = m.frame();
    f.time = m.time();
    if (!botarena::StalemateState_IsValid(m.stalemate()))
        return std::nullopt;
    f.stalemate = static_cast<StalemateState>(m.stalemate());
    if (static_cast<size_t>(m.agents_size()) != agents)
        return std::nullopt;
    f.agents.reserve(m.agents_size());
    for (const auto &a : m.agents()) {
        if (a.index() != f.agents.size() || !valid_ref(a.target(), agents))
            return std::nullopt;
        f.agents.push_back(AgentView{a.index(), a.x(), a.y(), a.vx(), a.vy(), a.orientation(), a.weapon_orientation(),
            a.health(), a.alive(), a.target(), a.turning()});
    }
    f.projectiles.reserve(m.projectiles_size());
    for (const auto &p : m.projectiles()) {
        if (!botarena::ProjectileKind_IsValid(p.kind()) || !valid_ref(p.shooter(), agents)
            || !valid_ref(p.target(), agents))
            return std::nullopt;
        f.projectiles.push_back(ProjectileView{p.id(), p.shooter(), p.target(), p.x(), p.y(), p.vx(), p.vy(),
            p.damage(), p.heal(), p.visual_only(), static_cast<ProjectileKind>(p.kind()), p.ttl()});
    }
    f.events.reserve(m.events_size());
    for (const auto &e : m.events()) {
        if (!botarena::EventKind_IsValid(e.kind()) || !valid_ref(e.actor(), agents) || !valid_ref(e.subject(), agents)
            || !valid_ref(e.intended(), agents))
            return std::nullopt;
        f.events.push_back(BattleEvent{
            static_cast<EventKind>(e.kind()), e.actor(), e.subject(), e.intended(), e.amount(), e.projectile_id()});
    }
    return f;
}

} // namespace

botarena::BattleReplay to_replay(const BattleResult &r)
{
    botarena::BattleReplay msg;
    auto *cfg = msg.mutable_config();
    cfg->set_arena_width(r.config.arena_width);
    cfg->set_arena_height(r.config.arena_height);
    cfg->set_fps(r.config.fps);
    cfg->set_max_duration(r.config.max_duration);
    cfg->set_projectile_speed(r.config.projectile_speed);
    cfg->set_bot_radius(r.config.bot_radius);
    cfg->set_seed(r.config.seed);
    cfg->set_range_scale(r.config.range_scale);
    for (size_t i = 0; i < r.agents.size(); ++i) {
        const AgentSummary &a = r.agents[i];
        auto *info = msg.add_agents();
        info->set_id(a.id);
        info->set_name(a.name);
        info->set_team(static_cast<uint32_t>(a.team));
        info->set_chassis(a.chassis);
        info->set_plating(a.plating);
        info->set_weapon(a.weapon);
        info->set_behavior(behavior_name(a.behavior));
        info->set_target_priority(target_priority_name(a.target_priority));
        info->set_engagement_range(engagement_range_name(a.engagement_range));
        info->set_projectile(projectile_kind_name(a.projectile));
        info->set_archetype(weapon_archetype_name(a.archetype));
        info->set_min_range(a.min_range);
        info->set_max_range(a.max_range);
        info->set_is_healer(a.is_healer);
        info->set_allows_point_blank(a.allows_point_blank);
        auto *st = msg.add_stats();
        st->set_index(static_cast<uint32_t>(i));
        st->set_final_health(a.final_health);
        st->set_max_health(a.max_health);
        st->set_damage_dealt(a.damage_dealt);
        st->set_damage_taken(a.damage_taken);
        st->set_kills(a.kills);
        st->set_survived(a.survived);
    }
    msg.set_winner_team(static_cast<uint32_t>(r.winner_team));
    msg.set_total_frames(r.total_frames);
    msg.set_duration(r.duration);
    msg.set_cancelled(r.cancelled);
    for (const auto &id : r.team1_survivors)
        msg.add_team1_survivors(id);
    for (const auto &id : r.team2_survivors)
        msg.add_team2_survivors(id);
    for (const auto &f : r.frames)
        fill_frame(*msg.add_frames(), f);
    return msg;
}

std::optional<BattleResult> from_replay(const botarena::BattleReplay &msg)
{
    BattleResult r;
    const auto &cfg = msg.config();
    r.config.arena_width = cfg.arena_width();
    r.config.arena_height = cfg.arena_height();
    r.config.fps = cfg.fps();
    r.config.max_duration = cfg.max_duration();
    r.config.projectile_speed = cfg.projectile_speed();
    r.config.bot_radius = cfg.bot_radius();
    r.config.seed = cfg.seed();
    r.config.range_scale = cfg.range_scale();
    for (const auto &info : msg.agents()) {
        AgentSummary a;
        a.id = info.id();
        a.name = info.name();
        a.team = static_cast<int>(info.team());
        a.chassis = info.chassis();
        a.plating = info.plating();
        a.weapon = info.weapon();
        auto b = parse_behavior(info.behavior());
        auto tp = parse_target_priority(info.target_priority());
        auto er = parse_engagement_range(info.engagement_range());
        auto pk = parse_projectile_kind(info.projectile());
        auto wa = parse_archetype(info.archetype());
        if (!b || !tp || !er || !pk || !wa) {
            log::warn("[replay] agent {} has an unknown enum name", info.id());
            return std::nullopt;
        }
        a.behavior = *b;
        a.target_priority = *tp;
        a.engagement_range = *er;
        a.projectile = *pk;
        a.archetype = *wa;
        a.min_range = info.min_range();
        a.max_range = info.max_range();
        a.is_healer = info.is_healer();
        a.allows_point_blank = info.allows_point_blank();
        r.agents.push_back(std::move(a));
    }
    for (const auto &st : msg.stats()) {
        if (st.index() >= r.agents.size()) {
            log::warn("[replay] stats index {} out of range", st.index());
            return std::nullopt;
        }
        AgentSummary &a = r.agents[st.index()];
        a.final_health = st.final_health();
        a.max_health = st.max_health();
        a.damage_dealt = st.damage_dealt();
        a.damage_taken = st.damage_taken();
        a.kills = st.kills();
        a.survived = st.survived();
    }
    r.winner_team = static_cast<int>(msg.winner_team());
    r.total_frames = msg.total_frames();
    r.duration = msg.duration();
    r.cancelled = msg.cancelled();
    r.team1_survivors.assign(msg.team1_survivors().begin(), msg.team1_survivors().end());
    r.team2_survivors.assign(msg.team2_survivors().begin(), msg.team2_survivors().end());
    r.frames.reserve(msg.frames_size());
    for (const auto &m : msg.frames()) {
        auto f = read_frame(m, r.agents.size());
        if (!f) {
            log::warn("[replay] frame {} is inconsistent with the roster", m.frame());
            return std::nullopt;
        }
        r.frames.push_back(std::move(*f));
    }
    return r;
}

std::string serialize_replay(const BattleResult &r)
{
    std::string out;
    if (!to_replay(r).SerializeToString(&out))
        log::error("[replay] serialization failed frames={}", r.frames.size());
    return out;
}

std::optional<BattleResult> parse_replay(const std::string &bytes)
{
    botarena::BattleReplay msg;
    if (!msg.ParseFromString(bytes))
        return std::nullopt;
    return from_replay(msg);
}

} // namespace botarena::sim
