// SPDX-License-Identifier: Apache-2.0
// config_loader.hpp - YAML battle configuration, YAML rosters and PGM alpha bitmaps.
#pragma once
#include "sim/collision.hpp"
#include "sim/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace botarena::cfg {

// Only keys present in the file override the values already in cfg.
void apply_battle_overrides(sim::BattleConfig &cfg, const YAML::Node &root);
// Throws std::runtime_error when the file cannot be read or parsed, or a value is out of range.
sim::BattleConfig load_battle_config(const std::string &path);

struct Roster
{
    std::vector<sim::AgentSpawnDescriptor> agents; // team1 entries first, then team2
    std::map<std::string, sim::AlphaBitmap> platings;
};

sim::AgentSpawnDescriptor parse_agent(const YAML::Node &node, int team);
// Plating bitmap paths are resolved relative to the roster file.
Roster load_roster(const std::string &path);

// Binary 8-bit PGM (P5, maxval <= 255); the gray value is the alpha channel.
sim::AlphaBitmap read_pgm(const std::string &path);

} // namespace botarena::cfg
