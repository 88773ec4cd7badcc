// SPDX-License-Identifier: Apache-2.0
#include "sim/ai.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace botarena::sim {

namespace {

constexpr double kTimeEps = 1e-9;

MoveCommand toward(float deg, float speed)
{
    return MoveCommand{wrap360(deg), speed};
}

float band_point(const AgentState &a, float fraction)
{
    return a.min_range + (a.max_range - a.min_range) * fraction;
}

// Noise grows as intelligence drops; intelligence 10 is exact.
float selection_noise(Rng &rng, float k, int32_t intelligence)
{
    float draw = rng.uniform(0.f, k);
    return draw * static_cast<float>(10 - intelligence) / 10.f;
}

int pick_by_key(World &w, const AgentState &self, const std::vector<int> &cands, TargetPriority priority)
{
    int best = kNoTarget;
    float best_key = std::numeric_limits<float>::infinity();
    for (int c : cands) {
        const AgentState &o = w.agents[static_cast<size_t>(c)];
        float key = 0.f;
        switch (priority) {
            case TargetPriority::weakest:
                key = static_cast<float>(o.health) + selection_noise(w.rng, 20.f, self.intelligence);
                break;
            case TargetPriority::strongest:
                key = -static_cast<float>(o.health) + selection_noise(w.rng, 20.f, self.intelligence);
                break;
            case TargetPriority::furthest:
                key = -b2Distance(self.position, o.position) + selection_noise(w.rng, 50.f, self.intelligence);
                break;
            case TargetPriority::closest:
            case TargetPriority::focus_fire:
                key = b2Distance(self.position, o.position) + selection_noise(w.rng, 50.f, self.intelligence);
                break;
        }
        if (key < best_key) {
            best_key = key;
            best = c;
        }
    }
    return best;
}

bool target_invalid(const AgentState &self, const AgentState *t)
{
    if (!t || !t->alive)
        return true;
    return self.is_healer && t->full_health();
}

// Lateral heading (bearing +/- 90) that points most away from the touched walls.
float lateral_away_from_wall(float target_angle, Vec2 wall_push)
{
    float left = target_angle + 90.f;
    float right = target_angle - 90.f;
    return b2Dot(direction(left), wall_push) >= b2Dot(direction(right), wall_push) ? left : right;
}

MoveCommand behave_aggressive(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    if (in.distance < optimal_close_range(a))
        return toward(in.target_angle + 180.f, 0.5f);
    // Pin a cornered target from the side instead of pushing into it.
    if (in.target_cornered && in.distance < in.preferred)
        return toward(in.target_angle + a.strafe_dir * 90.f, 0.35f);
    if (in.distance > in.preferred)
        return toward(in.target_angle, 1.0f);
    return toward(in.target_angle + a.strafe_dir * 15.f, 0.6f);
}

MoveCommand behave_defensive(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    if (in.distance < in.preferred * 0.9f) {
        if (in.self_cornered)
            return toward(lateral_away_from_wall(in.target_angle, in.wall_push), 0.8f);
        float urgency = 1.f - in.distance / in.preferred;
        return toward(in.target_angle + 180.f, 0.6f + 0.4f * urgency);
    }
    if (in.distance > in.preferred * 1.05f)
        return toward(in.target_angle, 0.5f);
    return toward(in.target_angle + a.strafe_dir * 90.f, 0.25f);
}

MoveCommand behave_kiting(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    float back = in.target_angle + 180.f + a.strafe_dir * 40.f;
    if (in.distance < in.preferred * 0.9f)
        return toward(back, 0.9f);
    if (in.distance < in.preferred * 1.1f)
        return toward(back, 0.5f);
    return toward(in.target_angle + a.strafe_dir * 15.f, 0.8f);
}

MoveCommand behave_flanker(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    float radial = std::clamp((in.distance - in.preferred) / std::max(in.preferred, 1.f), -1.f, 1.f);
    // 70..110 degrees off the bearing: spiral in when far, out when close.
    float offset = 90.f - radial * 20.f;
    return toward(in.target_angle + a.strafe_dir * offset, 0.85f);
}

MoveCommand behave_sniper(World &, size_t, const BehaviorInput &in)
{
    if (in.distance < in.preferred * 0.7f)
        return toward(in.target_angle + 180.f, 1.0f);
    if (in.distance > in.preferred * 1.02f)
        return toward(in.target_angle, 0.6f);
    if (in.distance < in.preferred * 0.9f)
        return toward(in.target_angle + 180.f, 0.5f);
    return toward(in.target_angle, 0.f);
}

MoveCommand behave_hold(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    if (in.distance > a.max_range * 0.9f)
        return toward(in.target_angle, 0.2f);
    if (in.distance < a.min_range * 1.1f)
        return toward(in.target_angle + 180.f, 0.2f);
    return toward(in.target_angle, 0.f);
}

MoveCommand behave_berserker(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    double roll = w.rng.next01();
    if (roll < 0.60)
        return toward(in.target_angle + w.rng.uniform(-25.f, 25.f), 1.0f);
    if (roll < 0.85)
        return toward(in.target_angle + a.strafe_dir * (90.f + w.rng.uniform(-20.f, 20.f)), 0.8f);
    return toward(w.rng.uniform(0.f, 360.f), 1.0f);
}

MoveCommand behave_tactical(World &w, size_t idx, const BehaviorInput &in)
{
    const AgentState &a = w.agents[idx];
    float radial = std::clamp(2.f * (in.distance - in.preferred) / std::max(in.preferred, 1.f), -1.f, 1.f);
    float offset = 90.f - radial * 50.f;
    return toward(in.target_angle + a.strafe_dir * offset, 0.5f + 0.3f * std::fabs(radial));
}

MoveCommand behave_protector(World &w, size_t idx, const BehaviorInput &)
{
    return protector_command(w, idx);
}

void tick_timers(World &w, AgentState &a)
{
    a.wall_escape_timer = std::max(0.0, a.wall_escape_timer - w.dt);
    a.strafe_timer -= w.dt;
    if (a.strafe_timer <= 0.0) {
        a.strafe_dir = w.rng.sign();
        a.strafe_timer = w.rng.uniform(1.5, 3.5);
    }
}

} // namespace

float preferred_range(const AgentState &a)
{
    switch (a.engagement_range) {
        case EngagementRange::close:
            return band_point(a, 0.10f);
        case EngagementRange::optimal:
            return band_point(a, 0.50f);
        case EngagementRange::max:
            return band_point(a, 0.95f);
        case EngagementRange::automatic:
            break;
    }
    switch (a.behavior) {
        case Behavior::aggressive:
            return band_point(a, 0.15f);
        case Behavior::defensive:
            return band_point(a, 0.95f);
        case Behavior::kiting:
            return band_point(a, 0.78f);
        case Behavior::flanker:
            return band_point(a, 0.58f);
        case Behavior::sniper:
            return a.max_range * 0.96f;
        case Behavior::tactical:
        case Behavior::hold:
        case Behavior::berserker:
        case Behavior::protector:
            return band_point(a, 0.50f);
    }
    return band_point(a, 0.50f);
}

float optimal_close_range(const AgentState &a)
{
    return a.min_range > 0.f ? a.min_range * 1.15f : preferred_range(a);
}

int select_target(World &w, size_t idx)
{
    const AgentState &self = w.agents[idx];
    std::vector<int> cands;
    for (size_t j = 0; j < w.agents.size(); ++j) {
        const AgentState &o = w.agents[j];
        if (j == idx || !o.alive)
            continue;
        if (self.is_healer) {
            if (o.team == self.team && !o.full_health())
                cands.push_back(static_cast<int>(j));
        } else if (o.team != self.team && b2Distance(self.position, o.position) <= self.max_range * kPursuitFactor) {
            cands.push_back(static_cast<int>(j));
        }
    }
    if (cands.empty())
        return kNoTarget;

    TargetPriority priority = self.target_priority;
    if (priority == TargetPriority::focus_fire) {
        // Majority vote over teammates' current targets; first to reach the top count wins ties.
        std::vector<std::pair<int, int>> votes;
        for (size_t j = 0; j < w.agents.size(); ++j) {
            const AgentState &ally = w.agents[j];
            if (j == idx || !ally.alive || ally.team != self.team || ally.target == kNoTarget)
                continue;
            if (std::find(cands.begin(), cands.end(), ally.target) == cands.end())
                continue;
            auto it = std::find_if(votes.begin(), votes.end(), [&](auto &v) { return v.first == ally.target; });
            if (it == votes.end())
                votes.emplace_back(ally.target, 1);
            else
                ++it->second;
        }
        if (!votes.empty()) {
            auto best = votes.begin();
            for (auto it = votes.begin(); it != votes.end(); ++it) {
                if (it->second > best->second)
                    best = it;
            }
            return best->first;
        }
        priority = TargetPriority::weakest;
    }
    if (priority == TargetPriority::furthest) {
        std::vector<int> near;
        for (int c : cands) {
            if (b2Distance(self.position, w.agents[static_cast<size_t>(c)].position) <= self.max_range * kFurthestFactor)
                near.push_back(c);
        }
        if (!near.empty())
            return pick_by_key(w, self, near, priority);
    }
    return pick_by_key(w, self, cands, priority);
}

void update_targets(World &w)
{
    for (size_t i = 0; i < w.agents.size(); ++i) {
        AgentState &a = w.agents[i];
        if (!a.alive)
            continue;
        bool recheck = w.now - a.last_target_check >= kTargetRecheckSeconds - kTimeEps;
        if (recheck || a.target == kNoTarget || target_invalid(a, w.target_of(a))) {
            int prev = a.target;
            a.target = select_target(w, i);
            a.last_target_check = w.now;
            if (a.target != prev && a.target != kNoTarget)
                log::trace("[ai] {} targets {} t={}", a.id, w.agents[static_cast<size_t>(a.target)].id, w.now);
        }
    }
}

const std::array<BehaviorFn, kBehaviorCount> &behavior_table()
{
    // Order matches the Behavior enumerators.
    static const std::array<BehaviorFn, kBehaviorCount> table{
        &behave_aggressive,
        &behave_defensive,
        &behave_tactical,
        &behave_kiting,
        &behave_hold,
        &behave_flanker,
        &behave_sniper,
        &behave_berserker,
        &behave_protector,
    };
    return table;
}

MoveCommand protector_command(World &w, size_t idx)
{
    const AgentState &self = w.agents[idx];
    const AgentState *ally = nullptr;
    float lowest = std::numeric_limits<float>::infinity();
    const AgentState *enemy = nullptr;
    float nearest = std::numeric_limits<float>::infinity();
    for (size_t j = 0; j < w.agents.size(); ++j) {
        const AgentState &o = w.agents[j];
        if (j == idx || !o.alive)
            continue;
        if (o.team == self.team) {
            float frac = o.max_health > 0 ? o.health_fraction() : 1.f;
            if (frac < lowest) {
                lowest = frac;
                ally = &o;
            }
        } else {
            float d = b2Distance(self.position, o.position);
            if (d < nearest) {
                nearest = d;
                enemy = &o;
            }
        }
    }
    if (!ally)
        return wander_command(w, idx);

    const float ideal = std::min(55.f, std::max(self.min_range * 0.5f, 40.f));
    const float max_follow = std::min(self.max_range * 0.4f, 150.f);
    Vec2 spot = ally->position;
    if (enemy) {
        // Stand behind the ally, on the far side from the nearest threat.
        Vec2 away = unit(b2Sub(ally->position, enemy->position));
        spot = b2MulAdd(ally->position, ideal, away);
    } else {
        spot = b2MulAdd(ally->position, ideal, direction(ally->orientation + 180.f));
    }
    float to_spot = b2Distance(self.position, spot);
    if (to_spot < 10.f) {
        Vec2 face = enemy ? enemy->position : ally->position;
        return toward(angle_to(self.position, face) + w.rng.uniform(-15.f, 15.f), 0.1f);
    }
    float to_ally = b2Distance(self.position, ally->position);
    float speed = 0.5f;
    if (to_ally > max_follow)
        speed = 1.0f;
    else if (to_ally > ideal * 2.f)
        speed = 0.95f;
    else if (to_ally > ideal)
        speed = 0.85f;
    else if (to_spot > 30.f)
        speed = 0.7f;
    return toward(angle_to(self.position, spot), speed);
}

MoveCommand wander_command(World &w, size_t idx)
{
    AgentState &a = w.agents[idx];
    a.wander_timer -= w.dt;
    if (a.wander_timer <= 0.0) {
        a.wander_angle = w.rng.uniform(0.f, 360.f);
        a.wander_timer = w.rng.uniform(1.5, 3.0);
    }
    Vec2 spot = b2MulAdd(w.center(), kWanderOffset, direction(a.wander_angle));
    if (b2Distance(a.position, spot) < kWanderArrive)
        return toward(a.orientation + w.rng.uniform(-30.f, 30.f), 0.f);
    return toward(angle_to(a.position, spot), 0.5f);
}

MoveCommand dispersal_command(const World &w, size_t idx, Vec2 wall_push, bool blend_wall)
{
    const AgentState &self = w.agents[idx];
    auto centroid_of = [&](float radius, Vec2 &out)
    {
        Vec2 sum{0.f, 0.f};
        float weight = 0.f;
        for (size_t j = 0; j < w.agents.size(); ++j) {
            const AgentState &o = w.agents[j];
            if (j == idx || !o.alive)
                continue;
            if (b2Distance(self.position, o.position) > radius)
                continue;
            float k = o.team != self.team ? 2.f : 1.f;
            sum = b2MulAdd(sum, k, o.position);
            weight += k;
        }
        if (weight <= 0.f)
            return false;
        out = scaled(sum, 1.f / weight);
        return true;
    };
    Vec2 centroid{0.f, 0.f};
    Vec2 away{0.f, 0.f};
    if (centroid_of(kDispersalRadius, centroid) || centroid_of(std::numeric_limits<float>::infinity(), centroid))
        away = unit(b2Sub(self.position, centroid));
    if (b2Length(away) == 0.f)
        away = unit(b2Sub(w.center(), self.position));
    if (blend_wall && b2Length(wall_push) > 0.f) {
        Vec2 blended = b2Add(scaled(away, 0.7f), scaled(unit(wall_push), 0.3f));
        if (b2Length(blended) > 0.f)
            away = blended;
    }
    if (b2Length(away) == 0.f)
        return toward(self.orientation, 0.f);
    return toward(heading(away), 1.0f);
}

MoveCommand decide(World &w, size_t idx)
{
    AgentState &a = w.agents[idx];
    tick_timers(w, a);
    Vec2 wall_push = wall_escape_vector(a.position, w.cfg);
    bool escaping = a.wall_escape_timer > 0.0 && b2Length(wall_push) > 0.f;

    if (w.stalemate.dispersal_engaged())
        return dispersal_command(w, idx, wall_push, escaping);
    if (escaping)
        return toward(heading(wall_push), 0.85f);
    if (a.is_healer)
        return protector_command(w, idx);
    if (a.behavior == Behavior::protector) {
        bool has_ally = std::any_of(w.agents.begin(), w.agents.end(),
            [&](const AgentState &o) { return &o != &a && o.alive && o.team == a.team; });
        if (has_ally)
            return protector_command(w, idx);
    }
    const AgentState *t = w.target_of(a);
    if (!t || !t->alive)
        return wander_command(w, idx);

    BehaviorInput in;
    in.distance = b2Distance(a.position, t->position);
    in.target_angle = angle_to(a.position, t->position);
    in.preferred = preferred_range(a);
    in.target_cornered = against_wall(t->position, w.cfg);
    in.self_cornered = b2Length(wall_push) > 0.f;
    in.wall_push = wall_push;

    if (!a.allows_point_blank && a.min_range > 0.f && in.distance < a.min_range) {
        float urgency = 1.f - in.distance / a.min_range;
        return toward(in.target_angle + 180.f, 0.5f + 0.5f * urgency);
    }
    if (in.distance > a.max_range)
        return toward(in.target_angle, 1.0f);
    if (w.stalemate.stalemate_engaged())
        return a.team == 1 ? toward(in.target_angle, 1.0f) : toward(in.target_angle, 0.f);
    // Non-healer protectors without allies fall through here and steer like tactical agents.
    Behavior b = a.behavior == Behavior::protector ? Behavior::tactical : a.behavior;
    return behavior_table()[static_cast<size_t>(b)](w, idx, in);
}

} // namespace botarena::sim
