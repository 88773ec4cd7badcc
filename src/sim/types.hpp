// SPDX-License-Identifier: Apache-2.0
// types.hpp - battle configuration, agent/projectile state and tick events.
#pragma once
#include "sim/vector_math.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace botarena::sim {

enum class Behavior : uint8_t
{
    aggressive,
    defensive,
    tactical,
    kiting,
    hold,
    flanker,
    sniper,
    berserker,
    protector
};
constexpr size_t kBehaviorCount = 9;

enum class TargetPriority : uint8_t
{
    focus_fire,
    weakest,
    strongest,
    closest,
    furthest
};

enum class EngagementRange : uint8_t
{
    automatic,
    close,
    optimal,
    max
};

enum class ProjectileKind : uint8_t
{
    bullet,
    laser,
    cannon,
    missile,
    heal,
    shockwave
};

enum class WeaponArchetype : uint8_t
{
    brawler,
    skirmisher,
    rifle,
    sniper
};

// Parsers accept the lowercase names below plus upper-case variants ("FOCUS_FIRE", "AUTO").
std::optional<Behavior> parse_behavior(std::string_view s);
std::optional<TargetPriority> parse_target_priority(std::string_view s);
std::optional<EngagementRange> parse_engagement_range(std::string_view s);
std::optional<ProjectileKind> parse_projectile_kind(std::string_view s);
const char *behavior_name(Behavior b);
const char *target_priority_name(TargetPriority p);
const char *engagement_range_name(EngagementRange e);
const char *projectile_kind_name(ProjectileKind k);
const char *weapon_archetype_name(WeaponArchetype w);

// Chassis fallback when a roster entry names no behavior.
Behavior default_behavior_for_chassis(std::string_view chassis);
// Derived from catalog (unscaled) ranges.
WeaponArchetype classify_weapon(float catalog_min_range, float catalog_max_range);
float projectile_speed_multiplier(ProjectileKind k);

struct BattleConfig
{
    float arena_width{1000.f};
    float arena_height{1000.f};
    uint32_t fps{30};
    float max_duration{120.f}; // seconds
    float projectile_speed{500.f}; // pixels per second
    float bot_radius{32.f};
    uint64_t seed{1};
    float range_scale{2.5f}; // catalog range units -> arena pixels
    size_t mask_cache_capacity{256}; // rotated masks across all platings
    float mask_scale{1.f}; // bitmap pixel -> arena pixel
    uint32_t yield_every_ticks{30}; // async runner only
    bool use_masks{true};

    double dt() const { return 1.0 / static_cast<double>(fps); }
    uint64_t max_frames() const { return static_cast<uint64_t>(static_cast<double>(max_duration) * fps); }
};

// Upper bound on max_duration * fps; every frame is kept in memory until the battle finishes.
constexpr uint64_t kMaxBattleFrames = 10'000'000;

// Throws std::invalid_argument naming the first field that cannot drive a battle
// (non-finite or non-positive sizes and speeds, fps 0, a negative or oversized duration).
void validate_battle_config(const BattleConfig &cfg);

// Roster entry as supplied by the parts catalog collaborator. Ranges are catalog units.
struct AgentSpawnDescriptor
{
    std::string id;
    std::string name;
    int team{1};
    std::string chassis;
    std::string plating;
    std::string weapon;
    int32_t max_health{100};
    float speed{100.f}; // pixels per second
    float rotation_speed{90.f}; // degrees per second
    float turret_rotation_speed{15.f}; // degrees per second
    int32_t intelligence{5}; // 0..10
    float agility{0.5f};
    int32_t damage_per_shot{10};
    float shots_per_minute{60.f};
    float min_range{0.f};
    float max_range{100.f};
    bool is_healer{false};
    float muzzle_offset{50.f};
    std::optional<Behavior> behavior;
    std::optional<TargetPriority> target_priority;
    EngagementRange engagement_range{EngagementRange::automatic};
    std::optional<ProjectileKind> projectile;
};

constexpr int kNoTarget = -1;

struct AgentState
{
    // identity / pass-through visual references
    std::string id;
    std::string name;
    int team{1};
    std::string chassis;
    std::string plating;
    std::string weapon;
    // combat stats, immutable for the battle (ranges already scaled to pixels)
    int32_t max_health{100};
    float speed{100.f};
    float rotation_speed{90.f};
    float turret_rotation_speed{15.f};
    int32_t intelligence{5};
    float agility{0.5f};
    int32_t damage_per_shot{10};
    float shots_per_second{1.f};
    float min_range{0.f};
    float max_range{0.f};
    bool is_healer{false};
    bool allows_point_blank{false};
    float muzzle_offset{50.f};
    ProjectileKind projectile{ProjectileKind::bullet};
    WeaponArchetype archetype{WeaponArchetype::brawler};
    // AI configuration
    Behavior behavior{Behavior::tactical};
    TargetPriority target_priority{TargetPriority::closest};
    EngagementRange engagement_range{EngagementRange::automatic};
    // runtime
    Vec2 position{0.f, 0.f};
    Vec2 velocity{0.f, 0.f};
    float orientation{0.f};
    float weapon_orientation{0.f};
    float target_orientation{0.f};
    bool turning{false};
    int32_t health{100};
    bool alive{true};
    double last_shot_time{0.0};
    int target{kNoTarget}; // index into the battle's agent list
    double last_target_check{0.0};
    int strafe_dir{1};
    double strafe_timer{0.0};
    float wander_angle{0.f};
    double wander_timer{0.0};
    double wall_escape_timer{0.0};
    double last_wall_contact{-1.0};
    // statistics
    int32_t damage_dealt{0};
    int32_t damage_taken{0};
    int32_t kills{0};

    // Returns the damage actually applied (never more than remaining health).
    int32_t take_damage(int32_t amount);
    // Returns the amount actually restored; dead agents cannot be healed.
    int32_t heal(int32_t amount);
    bool can_shoot(double now) const;
    float health_fraction() const;
    bool full_health() const { return health >= max_health; }
};

struct Projectile
{
    uint32_t id{0};
    int shooter{kNoTarget};
    int target{kNoTarget};
    Vec2 position{0.f, 0.f};
    Vec2 velocity{0.f, 0.f};
    int32_t damage{0};
    bool heal{false};
    bool alive{true};
    bool visual_only{false}; // cosmetic, never collides
    ProjectileKind kind{ProjectileKind::bullet};
    float ttl{-1.f}; // seconds, -1 = unbounded
};

enum class EventKind : uint8_t
{
    shot,
    hit,
    heal,
    kill,
    blocked,
    stalemate_engaged,
    dispersal_engaged
};

const char *event_kind_name(EventKind k);

// Agent references are indices into the battle's agent list (-1 when not applicable).
// shot: actor=shooter subject=target; hit/heal: actor=shooter subject=receiver amount=applied;
// kill: actor=killer subject=victim; blocked: actor=shooter subject=blocker intended=target.
struct BattleEvent
{
    EventKind kind{EventKind::shot};
    int actor{kNoTarget};
    int subject{kNoTarget};
    int intended{kNoTarget};
    int32_t amount{0};
    uint32_t projectile_id{0};
};

} // namespace botarena::sim
