// SPDX-License-Identifier: Apache-2.0
#include "cfg/config_loader.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/battle.hpp"
#include "sim/replay.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace {
std::atomic<botarena::sim::BattleContext *> g_active{nullptr};
}

static void handle_signal(int)
{
    if (auto *ctx = g_active.load())
        ctx->cancel.store(true);
}

static void usage()
{
    botarena::log::error(
        "usage: botarena_sim [battle.yaml] --roster <roster.yaml> [--seed N] [--max-duration S] "
        "[--replay <out.pb>] [--no-masks]");
}

int main(int argc, char **argv)
{
    std::string config_path;
    std::string roster_path;
    std::string replay_path;
    std::optional<uint64_t> seed_override;
    std::optional<float> duration_override;
    bool no_masks = false;
    botarena::log::init();
    // Simple arg parsing: first non-flag = battle config path
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--roster" && i + 1 < argc) {
            roster_path = argv[++i];
        } else if (a == "--replay" && i + 1 < argc) {
            replay_path = argv[++i];
        } else if (a == "--seed" && i + 1 < argc) {
            try {
                seed_override = std::stoull(argv[++i]);
            } catch (const std::exception &) {
                botarena::log::warn("Invalid --seed value '{}', ignoring", argv[i]);
            }
        } else if (a == "--max-duration" && i + 1 < argc) {
            try {
                duration_override = std::stof(argv[++i]);
            } catch (const std::exception &) {
                botarena::log::warn("Invalid --max-duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--no-masks") {
            no_masks = true;
        } else if (a == "--help" || a == "-h") {
            usage();
            return 0;
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        } else {
            botarena::log::warn("Unknown argument '{}', ignoring", a);
        }
    }
    if (roster_path.empty()) {
        usage();
        return 2;
    }

    botarena::sim::BattleConfig cfg;
    botarena::cfg::Roster roster;
    auto ctx = std::make_shared<botarena::sim::BattleContext>();
    try {
        if (!config_path.empty())
            cfg = botarena::cfg::load_battle_config(config_path);
        if (seed_override)
            cfg.seed = *seed_override;
        if (duration_override)
            cfg.max_duration = *duration_override;
        if (no_masks)
            cfg.use_masks = false;
        // command-line overrides bypass the loader's checks
        botarena::sim::validate_battle_config(cfg);
        roster = botarena::cfg::load_roster(roster_path);

        std::shared_ptr<botarena::sim::CollisionProvider> oracle;
        if (cfg.use_masks && !roster.platings.empty()) {
            auto bitmaps =
                std::make_shared<botarena::sim::BitmapCollisionProvider>(cfg.mask_cache_capacity, cfg.mask_scale);
            for (const auto &[id, bmp] : roster.platings)
                bitmaps->register_plating(id, bmp);
            oracle = bitmaps;
        }
        ctx->battle_id = std::filesystem::path(roster_path).stem().string() + "-" + std::to_string(cfg.seed);
        ctx->battle = std::make_unique<botarena::sim::Battle>(cfg, oracle);
        for (const auto &d : roster.agents)
            ctx->battle->add_agent(d);
    } catch (const std::exception &ex) {
        botarena::log::error("Failed to set up battle: {}", ex.what());
        botarena::log::flush();
        return 1;
    }
    botarena::log::info("Arena: {}x{} fps={} max_duration={}s seed={} masks={}", cfg.arena_width, cfg.arena_height,
        cfg.fps, cfg.max_duration, cfg.seed, cfg.use_masks);

    g_active.store(ctx.get());
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    auto scheduler = coro::default_executor::io_executor();
    coro::sync_wait(botarena::sim::run_battle(scheduler, ctx));
    g_active.store(nullptr);

    const botarena::sim::BattleResult &r = *ctx->result;
    if (!replay_path.empty()) {
        std::ofstream out(replay_path, std::ios::binary);
        std::string bytes = botarena::sim::serialize_replay(r);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            botarena::log::error("Failed to write replay {}", replay_path);
            botarena::log::flush();
            return 1;
        }
        botarena::log::info("Replay written: {} ({} bytes)", replay_path, bytes.size());
    }
    for (const auto &a : r.agents) {
        botarena::log::info("agent {} team={} hp={}/{} dealt={} taken={} kills={} survived={}", a.id, a.team,
            a.final_health, a.max_health, a.damage_dealt, a.damage_taken, a.kills, a.survived);
    }
    auto &rc = botarena::metrics::runtime();
    std::ostringstream j;
    j << "{\"metric\":\"battle_summary\",\"winner_team\":" << r.winner_team << ",\"frames\":" << r.total_frames
      << ",\"duration\":" << r.duration << ",\"cancelled\":" << (r.cancelled ? "true" : "false")
      << ",\"shots\":" << botarena::metrics::get(rc.shots_fired) << ",\"hits\":" << botarena::metrics::get(rc.hits)
      << ",\"heals\":" << botarena::metrics::get(rc.heals) << ",\"blocked\":" << botarena::metrics::get(rc.blocked_shots)
      << ",\"kills\":" << botarena::metrics::get(rc.kills)
      << ",\"stalemates\":" << botarena::metrics::get(rc.stalemate_engagements)
      << ",\"dispersals\":" << botarena::metrics::get(rc.dispersal_engagements)
      << ",\"tick_avg_ns\":" << botarena::metrics::avg_tick_ns()
      << ",\"tick_p99_ns\":" << botarena::metrics::approx_tick_p99()
      << ",\"mask_hits\":" << botarena::metrics::get(rc.mask_cache_hits)
      << ",\"mask_misses\":" << botarena::metrics::get(rc.mask_cache_misses) << "}";
    botarena::log::info("{}", j.str());
    botarena::log::flush();
    return r.cancelled ? 130 : 0;
}
