// SPDX-License-Identifier: Apache-2.0
#include "sim/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace botarena::sim {

namespace {

std::string normalize(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '-' || c == ' ')
            c = '_';
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

template <typename E, size_t N>
std::optional<E> lookup(const std::array<std::pair<const char *, E>, N> &table, std::string_view s)
{
    std::string key = normalize(s);
    for (auto &[name, value] : table) {
        if (key == name)
            return value;
    }
    return std::nullopt;
}

constexpr std::array<std::pair<const char *, Behavior>, kBehaviorCount> kBehaviors{{
    {"aggressive", Behavior::aggressive},
    {"defensive", Behavior::defensive},
    {"tactical", Behavior::tactical},
    {"kiting", Behavior::kiting},
    {"hold", Behavior::hold},
    {"flanker", Behavior::flanker},
    {"sniper", Behavior::sniper},
    {"berserker", Behavior::berserker},
    {"protector", Behavior::protector},
}};

constexpr std::array<std::pair<const char *, TargetPriority>, 5> kPriorities{{
    {"focus_fire", TargetPriority::focus_fire},
    {"weakest", TargetPriority::weakest},
    {"strongest", TargetPriority::strongest},
    {"closest", TargetPriority::closest},
    {"furthest", TargetPriority::furthest},
}};

constexpr std::array<std::pair<const char *, EngagementRange>, 5> kRanges{{
    {"auto", EngagementRange::automatic},
    {"automatic", EngagementRange::automatic},
    {"close", EngagementRange::close},
    {"optimal", EngagementRange::optimal},
    {"max", EngagementRange::max},
}};

constexpr std::array<std::pair<const char *, ProjectileKind>, 6> kProjectiles{{
    {"bullet", ProjectileKind::bullet},
    {"laser", ProjectileKind::laser},
    {"cannon", ProjectileKind::cannon},
    {"missile", ProjectileKind::missile},
    {"heal", ProjectileKind::heal},
    {"shockwave", ProjectileKind::shockwave},
}};

} // namespace

std::optional<Behavior> parse_behavior(std::string_view s)
{
    return lookup(kBehaviors, s);
}

std::optional<TargetPriority> parse_target_priority(std::string_view s)
{
    return lookup(kPriorities, s);
}

std::optional<EngagementRange> parse_engagement_range(std::string_view s)
{
    return lookup(kRanges, s);
}

std::optional<ProjectileKind> parse_projectile_kind(std::string_view s)
{
    return lookup(kProjectiles, s);
}

const char *behavior_name(Behavior b)
{
    return kBehaviors[static_cast<size_t>(b)].first;
}

const char *target_priority_name(TargetPriority p)
{
    return kPriorities[static_cast<size_t>(p)].first;
}

const char *engagement_range_name(EngagementRange e)
{
    switch (e) {
        case EngagementRange::automatic:
            return "auto";
        case EngagementRange::close:
            return "close";
        case EngagementRange::optimal:
            return "optimal";
        case EngagementRange::max:
            return "max";
    }
    return "auto";
}

const char *projectile_kind_name(ProjectileKind k)
{
    return kProjectiles[static_cast<size_t>(k)].first;
}

const char *weapon_archetype_name(WeaponArchetype w)
{
    switch (w) {
        case WeaponArchetype::brawler:
            return "brawler";
        case WeaponArchetype::skirmisher:
            return "skirmisher";
        case WeaponArchetype::rifle:
            return "rifle";
        case WeaponArchetype::sniper:
            return "sniper";
    }
    return "brawler";
}

const char *event_kind_name(EventKind k)
{
    switch (k) {
        case EventKind::shot:
            return "shot";
        case EventKind::hit:
            return "hit";
        case EventKind::heal:
            return "heal";
        case EventKind::kill:
            return "kill";
        case EventKind::blocked:
            return "blocked";
        case EventKind::stalemate_engaged:
            return "stalemate_engaged";
        case EventKind::dispersal_engaged:
            return "dispersal_engaged";
    }
    return "shot";
}

Behavior default_behavior_for_chassis(std::string_view chassis)
{
    static constexpr std::array<std::pair<std::string_view, Behavior>, 7> table{{
        {"DLZ-100", Behavior::tactical},
        {"DLZ-250", Behavior::aggressive},
        {"SmartMove", Behavior::tactical},
        {"CLR-Z050", Behavior::defensive},
        {"Electron", Behavior::tactical},
        {"Durichas", Behavior::defensive},
        {"Deliverance", Behavior::defensive},
    }};
    auto it = std::find_if(table.begin(), table.end(), [&](auto &e) { return e.first == chassis; });
    return it != table.end() ? it->second : Behavior::tactical;
}

WeaponArchetype classify_weapon(float catalog_min_range, float catalog_max_range)
{
    if (catalog_min_range > 30.f)
        return catalog_max_range >= 180.f ? WeaponArchetype::sniper : WeaponArchetype::rifle;
    if (catalog_max_range > 150.f)
        return WeaponArchetype::skirmisher;
    return WeaponArchetype::brawler;
}

float projectile_speed_multiplier(ProjectileKind k)
{
    switch (k) {
        case ProjectileKind::laser:
            return 2.0f;
        case ProjectileKind::cannon:
            return 0.65f;
        case ProjectileKind::missile:
            return 0.8f;
        case ProjectileKind::heal:
            return 1.8f;
        case ProjectileKind::shockwave:
            return 2.5f;
        case ProjectileKind::bullet:
            return 1.0f;
    }
    return 1.0f;
}

int32_t AgentState::take_damage(int32_t amount)
{
    if (amount <= 0 || !alive)
        return 0;
    int32_t actual = std::min(amount, health);
    health -= actual;
    damage_taken += actual;
    if (health <= 0) {
        health = 0;
        alive = false;
    }
    return actual;
}

int32_t AgentState::heal(int32_t amount)
{
    if (!alive || amount <= 0)
        return 0;
    int32_t actual = std::min(amount, max_health - health);
    if (actual < 0)
        actual = 0;
    health += actual;
    return actual;
}

bool AgentState::can_shoot(double now) const
{
    if (shots_per_second <= 0.f)
        return false;
    return now - last_shot_time >= 1.0 / static_cast<double>(shots_per_second);
}

float AgentState::health_fraction() const
{
    if (max_health <= 0)
        return 0.f;
    return static_cast<float>(health) / static_cast<float>(max_health);
}

void validate_battle_config(const BattleConfig &cfg)
{
    auto positive = [](float v) { return std::isfinite(v) && v > 0.f; };
    if (cfg.fps == 0)
        throw std::invalid_argument("fps must be positive");
    if (!positive(cfg.arena_width) || !positive(cfg.arena_height))
        throw std::invalid_argument("arena size must be positive");
    if (!std::isfinite(cfg.max_duration) || cfg.max_duration < 0.f)
        throw std::invalid_argument("max_duration must be a non-negative number of seconds");
    if (static_cast<double>(cfg.max_duration) * cfg.fps > static_cast<double>(kMaxBattleFrames))
        throw std::invalid_argument("max_duration * fps exceeds " + std::to_string(kMaxBattleFrames) + " frames");
    if (!positive(cfg.bot_radius))
        throw std::invalid_argument("bot_radius must be positive");
    if (!positive(cfg.projectile_speed))
        throw std::invalid_argument("projectile_speed must be positive");
    if (!positive(cfg.range_scale))
        throw std::invalid_argument("range_scale must be positive");
    if (!positive(cfg.mask_scale))
        throw std::invalid_argument("mask_scale must be positive");
}

} // namespace botarena::sim
