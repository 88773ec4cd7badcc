// SPDX-License-Identifier: Apache-2.0
// battle.hpp - the fixed-timestep battle clock and its coroutine runner.
#pragma once
#include "sim/collision.hpp"
#include "sim/recorder.hpp"
#include "sim/world.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace botarena::sim {

class Battle
{
public:
    // A null oracle selects the circle provider for the whole run.
    // Throws std::invalid_argument when cfg fails validate_battle_config.
    explicit Battle(const BattleConfig &cfg, std::shared_ptr<CollisionProvider> oracle = nullptr);

    // Validates and converts a catalog unit; returns its agent index.
    // Throws std::invalid_argument on a bad team, non-positive health, negative range or duplicate id.
    size_t add_agent(const AgentSpawnDescriptor &d);

    // Spreads each team along its own edge. Skipped by run() when agents were placed explicitly.
    void setup_positions();
    void place(size_t idx, Vec2 position, float orientation);

    // Advances one tick and records its frame. Returns true once the battle is over.
    bool step();
    bool over() const { return over_; }

    // Builds the result and hands over the recorded frames; the battle cannot be stepped afterwards.
    BattleResult finish(bool cancelled = false);
    // Runs to completion, or until *cancel becomes true (checked between ticks).
    BattleResult run(const std::atomic_bool *cancel = nullptr);

    World &world() { return world_; }
    const World &world() const { return world_; }
    const std::vector<FrameSnapshot> &frames() const { return frames_; }
    CollisionProvider &oracle() { return *oracle_; }

    // Shown with the frame number on every log line written during a tick.
    void set_label(std::string label) { label_ = std::move(label); }
    const std::string &label() const { return label_; }

private:
    void begin();
    bool termination_reached() const;

    World world_;
    std::shared_ptr<CollisionProvider> oracle_;
    CircleCollisionProvider fallback_;
    std::vector<FrameSnapshot> frames_;
    std::string label_;
    bool positioned_{false};
    bool started_{false};
    bool over_{false};
    bool finished_{false};
};

struct BattleContext
{
    std::string battle_id;
    std::unique_ptr<Battle> battle;
    std::atomic_bool cancel{false};
    std::atomic_bool done{false};
    std::optional<BattleResult> result;
};

// Drives ctx->battle on the scheduler, yielding every cfg.yield_every_ticks ticks so that many
// battles can share one executor. Sets ctx->result and ctx->done when it returns.
coro::task<void> run_battle(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BattleContext> ctx);

} // namespace botarena::sim
