// SPDX-License-Identifier: Apache-2.0
// replay.hpp - BattleResult <-> protobuf BattleReplay.
#pragma once
#include "battle.pb.h"
#include "sim/recorder.hpp"

#include <optional>
#include <string>

namespace botarena::sim {

botarena::BattleReplay to_replay(const BattleResult &r);
// Fails (nullopt) on unknown enum names in the agent table or out-of-range agent indices.
std::optional<BattleResult> from_replay(const botarena::BattleReplay &msg);

std::string serialize_replay(const BattleResult &r);
std::optional<BattleResult> parse_replay(const std::string &bytes);

} // namespace botarena::sim
