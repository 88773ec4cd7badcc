// SPDX-License-Identifier: Apache-2.0
// recorder.hpp - per-tick frame snapshots and the aggregate battle result.
#pragma once
#include "sim/stalemate.hpp"
#include "sim/world.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace botarena::sim {

struct AgentView
{
    uint32_t index{0}; // into BattleResult::agents
    float x{0.f};
    float y{0.f};
    float vx{0.f};
    float vy{0.f};
    float orientation{0.f};
    float weapon_orientation{0.f};
    int32_t health{0};
    bool alive{false};
    int target{kNoTarget};
    bool turning{false};

    bool operator==(const AgentView &) const = default;
};

struct ProjectileView
{
    uint32_t id{0};
    int shooter{kNoTarget};
    int target{kNoTarget};
    float x{0.f};
    float y{0.f};
    float vx{0.f};
    float vy{0.f};
    int32_t damage{0};
    bool heal{false};
    bool visual_only{false};
    ProjectileKind kind{ProjectileKind::bullet};
    float ttl{-1.f};

    bool operator==(const ProjectileView &) const = default;
};

// Immutable once appended to a result.
struct FrameSnapshot
{
    uint64_t frame{0};
    double time{0.0};
    StalemateState stalemate{StalemateState::normal};
    std::vector<AgentView> agents;
    std::vector<ProjectileView> projectiles;
    std::vector<BattleEvent> events;
};

FrameSnapshot capture_frame(const World &w);

// Identity, loadout and final statistics of one agent.
struct AgentSummary
{
    std::string id;
    std::string name;
    int team{1};
    std::string chassis;
    std::string plating;
    std::string weapon;
    Behavior behavior{Behavior::tactical};
    TargetPriority target_priority{TargetPriority::closest};
    EngagementRange engagement_range{EngagementRange::automatic};
    ProjectileKind projectile{ProjectileKind::bullet};
    WeaponArchetype archetype{WeaponArchetype::brawler};
    float min_range{0.f};
    float max_range{0.f};
    bool is_healer{false};
    bool allows_point_blank{false};
    int32_t final_health{0};
    int32_t max_health{0};
    int32_t damage_dealt{0};
    int32_t damage_taken{0};
    int32_t kills{0};
    bool survived{false};
};

struct BattleResult
{
    int winner_team{0}; // 0 = draw
    uint64_t total_frames{0};
    double duration{0.0}; // total_frames / fps
    BattleConfig config;
    bool cancelled{false};
    std::vector<std::string> team1_survivors;
    std::vector<std::string> team2_survivors;
    std::vector<AgentSummary> agents; // insertion order
    std::vector<FrameSnapshot> frames;

    const AgentSummary *find(const std::string &id) const;
};

// Winner is the only team with survivors; both or neither alive is a draw.
int winner_of(const std::vector<AgentState> &agents);

BattleResult build_result(const World &w, std::vector<FrameSnapshot> frames, bool cancelled);

} // namespace botarena::sim
