// SPDX-License-Identifier: Apache-2.0
#include "cfg/config_loader.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace botarena::cfg {

namespace {

template <typename E, typename Parse>
E require_enum(const YAML::Node &node, const char *key, Parse parse, const std::string &agent)
{
    auto text = node[key].as<std::string>();
    auto v = parse(text);
    if (!v)
        throw std::runtime_error("agent " + agent + ": unknown " + key + " '" + text + "'");
    return *v;
}

// Whitespace- and comment-separated header token of a PGM file.
std::string pgm_token(std::istream &in)
{
    std::string tok;
    int c;
    while ((c = in.get()) != EOF) {
        if (c == '#') {
            while ((c = in.get()) != EOF && c != '\n') { }
            continue;
        }
        if (std::isspace(c)) {
            if (!tok.empty())
                break;
            continue;
        }
        tok.push_back(static_cast<char>(c));
    }
    return tok;
}

uint32_t pgm_number(std::istream &in, const std::string &path)
{
    auto tok = pgm_token(in);
    if (tok.empty() || tok.find_first_not_of("0123456789") != std::string::npos)
        throw std::runtime_error("malformed PGM header in " + path);
    return static_cast<uint32_t>(std::stoul(tok));
}

} // namespace

void apply_battle_overrides(sim::BattleConfig &cfg, const YAML::Node &root)
{
    if (root["arena_width"])
        cfg.arena_width = root["arena_width"].as<float>();
    if (root["arena_height"])
        cfg.arena_height = root["arena_height"].as<float>();
    if (root["fps"])
        cfg.fps = root["fps"].as<uint32_t>();
    if (root["max_duration"])
        cfg.max_duration = root["max_duration"].as<float>();
    if (root["projectile_speed"])
        cfg.projectile_speed = root["projectile_speed"].as<float>();
    if (root["bot_radius"])
        cfg.bot_radius = root["bot_radius"].as<float>();
    if (root["seed"])
        cfg.seed = root["seed"].as<uint64_t>();
    if (root["range_scale"])
        cfg.range_scale = root["range_scale"].as<float>();
    if (root["mask_cache_capacity"])
        cfg.mask_cache_capacity = root["mask_cache_capacity"].as<size_t>();
    if (root["mask_scale"])
        cfg.mask_scale = root["mask_scale"].as<float>();
    if (root["yield_every_ticks"])
        cfg.yield_every_ticks = root["yield_every_ticks"].as<uint32_t>();
    if (root["use_masks"])
        cfg.use_masks = root["use_masks"].as<bool>();
}

sim::BattleConfig load_battle_config(const std::string &path)
{
    sim::BattleConfig cfg;
    try {
        YAML::Node root = YAML::LoadFile(path);
        apply_battle_overrides(cfg, root);
    } catch (const YAML::Exception &e) {
        throw std::runtime_error("battle config " + path + ": " + e.what());
    }
    try {
        sim::validate_battle_config(cfg);
    } catch (const std::invalid_argument &e) {
        throw std::runtime_error("battle config " + path + ": " + e.what());
    }
    log::debug("[cfg] battle arena={}x{} fps={} max_duration={} seed={}", cfg.arena_width, cfg.arena_height, cfg.fps,
        cfg.max_duration, cfg.seed);
    return cfg;
}

sim::AgentSpawnDescriptor parse_agent(const YAML::Node &node, int team)
{
    sim::AgentSpawnDescriptor d;
    d.team = team;
    if (!node["id"])
        throw std::runtime_error("roster agent without id");
    d.id = node["id"].as<std::string>();
    if (node["name"])
        d.name = node["name"].as<std::string>();
    if (node["chassis"])
        d.chassis = node["chassis"].as<std::string>();
    if (node["plating"])
        d.plating = node["plating"].as<std::string>();
    if (node["weapon"])
        d.weapon = node["weapon"].as<std::string>();
    if (node["max_health"])
        d.max_health = node["max_health"].as<int32_t>();
    if (node["speed"])
        d.speed = node["speed"].as<float>();
    if (node["rotation_speed"])
        d.rotation_speed = node["rotation_speed"].as<float>();
    if (node["turret_rotation_speed"])
        d.turret_rotation_speed = node["turret_rotation_speed"].as<float>();
    if (node["intelligence"])
        d.intelligence = node["intelligence"].as<int32_t>();
    if (node["agility"])
        d.agility = node["agility"].as<float>();
    if (node["damage_per_shot"])
        d.damage_per_shot = node["damage_per_shot"].as<int32_t>();
    if (node["shots_per_minute"])
        d.shots_per_minute = node["shots_per_minute"].as<float>();
    else if (node["shots_per_second"])
        d.shots_per_minute = node["shots_per_second"].as<float>() * 60.f;
    if (node["min_range"])
        d.min_range = node["min_range"].as<float>();
    if (node["max_range"])
        d.max_range = node["max_range"].as<float>();
    if (node["is_healer"])
        d.is_healer = node["is_healer"].as<bool>();
    if (node["muzzle_offset"])
        d.muzzle_offset = node["muzzle_offset"].as<float>();
    if (node["behavior"])
        d.behavior = require_enum<sim::Behavior>(node, "behavior", sim::parse_behavior, d.id);
    if (node["target_priority"])
        d.target_priority = require_enum<sim::TargetPriority>(node, "target_priority", sim::parse_target_priority, d.id);
    if (node["engagement_range"])
        d.engagement_range =
            require_enum<sim::EngagementRange>(node, "engagement_range", sim::parse_engagement_range, d.id);
    if (node["projectile"])
        d.projectile = require_enum<sim::ProjectileKind>(node, "projectile", sim::parse_projectile_kind, d.id);
    return d;
}

Roster load_roster(const std::string &path)
{
    Roster roster;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw std::runtime_error("roster " + path + ": " + e.what());
    }
    try {
        for (int team : {1, 2}) {
            const char *key = team == 1 ? "team1" : "team2";
            if (!root[key])
                continue;
            if (!root[key].IsSequence())
                throw std::runtime_error(std::string("roster ") + path + ": " + key + " must be a list");
            for (const auto &n : root[key])
                roster.agents.push_back(parse_agent(n, team));
        }
        if (root["platings"]) {
            auto base = std::filesystem::path(path).parent_path();
            for (const auto &kv : root["platings"]) {
                auto id = kv.first.as<std::string>();
                std::filesystem::path p = kv.second.as<std::string>();
                if (p.is_relative())
                    p = base / p;
                roster.platings.emplace(id, read_pgm(p.string()));
            }
        }
    } catch (const YAML::Exception &e) {
        throw std::runtime_error("roster " + path + ": " + e.what());
    }
    log::debug("[cfg] roster {} agents={} platings={}", path, roster.agents.size(), roster.platings.size());
    return roster;
}

sim::AlphaBitmap read_pgm(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open bitmap " + path);
    if (pgm_token(in) != "P5")
        throw std::runtime_error("not a binary PGM (P5): " + path);
    sim::AlphaBitmap bmp;
    bmp.width = pgm_number(in, path);
    bmp.height = pgm_number(in, path);
    uint32_t maxval = pgm_number(in, path);
    if (bmp.width == 0 || bmp.height == 0 || maxval == 0 || maxval > 255)
        throw std::runtime_error("unsupported PGM dimensions or maxval in " + path);
    // pgm_token consumed the single whitespace byte that ends the header
    bmp.alpha.resize(static_cast<size_t>(bmp.width) * bmp.height);
    in.read(reinterpret_cast<char *>(bmp.alpha.data()), static_cast<std::streamsize>(bmp.alpha.size()));
    if (in.gcount() != static_cast<std::streamsize>(bmp.alpha.size()))
        throw std::runtime_error("truncated PGM pixel data in " + path);
    if (maxval != 255) {
        for (auto &v : bmp.alpha)
            v = static_cast<uint8_t>(std::min<uint32_t>(255, v * 255u / maxval));
    }
    return bmp;
}

} // namespace botarena::cfg
