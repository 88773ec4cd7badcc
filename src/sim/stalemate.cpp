// SPDX-License-Identifier: Apache-2.0
#include "sim/stalemate.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/movement.hpp"

namespace botarena::sim {

namespace {
// Timer comparisons against tick-derived times (frame / fps) must not miss an exact boundary.
constexpr double kTimeEps = 1e-9;
} // namespace

const char *stalemate_state_name(StalemateState s)
{
    switch (s) {
        case StalemateState::normal:
            return "normal";
        case StalemateState::stalemate:
            return "stalemate";
        case StalemateState::dispersal:
            return "dispersal";
    }
    return "normal";
}

bool detect_corner_lock(const std::vector<AgentState> &agents, const BattleConfig &cfg)
{
    int against = 0;
    for (size_t i = 0; i < agents.size(); ++i) {
        const auto &a = agents[i];
        if (!a.alive)
            continue;
        if (against_wall(a.position, cfg) && ++against >= 2)
            return true;
        if (a.allows_point_blank)
            continue;
        for (size_t j = i + 1; j < agents.size(); ++j) {
            const auto &b = agents[j];
            if (!b.alive || b.team == a.team || b.allows_point_blank)
                continue;
            float d = b2Distance(a.position, b.position);
            if (d < a.min_range && d < b.min_range)
                return true;
        }
    }
    return false;
}

std::optional<EventKind> StalemateMonitor::update(
    double now, const std::vector<AgentState> &agents, const BattleConfig &cfg)
{
    double quiet = time_since_damage(now);
    switch (state_) {
        case StalemateState::dispersal:
            if (now - dispersal_started_ >= tuning_.dispersal_duration - kTimeEps) {
                state_ = StalemateState::normal;
                log::debug("[stalemate] dispersal over t={} quiet={}", now, quiet);
            }
            return std::nullopt;
        case StalemateState::normal:
            if (quiet >= tuning_.stalemate_after - kTimeEps) {
                state_ = StalemateState::stalemate;
                metrics::inc(metrics::runtime().stalemate_engagements);
                log::debug("[stalemate] engaged t={} quiet={}", now, quiet);
                return EventKind::stalemate_engaged;
            }
            return std::nullopt;
        case StalemateState::stalemate:
            if (quiet >= tuning_.dispersal_after - kTimeEps && detect_corner_lock(agents, cfg)) {
                state_ = StalemateState::dispersal;
                dispersal_started_ = now;
                metrics::inc(metrics::runtime().dispersal_engagements);
                log::debug("[stalemate] corner-lock, dispersal engaged t={} quiet={}", now, quiet);
                return EventKind::dispersal_engaged;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

void StalemateMonitor::on_enemy_damage(double now)
{
    last_damage_time_ = now;
    if (state_ == StalemateState::stalemate) {
        state_ = StalemateState::normal;
        log::debug("[stalemate] cleared by damage t={}", now);
    }
}

} // namespace botarena::sim
