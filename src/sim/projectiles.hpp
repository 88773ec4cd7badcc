// SPDX-License-Identifier: Apache-2.0
// projectiles.hpp - projectile advance and impact resolution.
#pragma once
#include "sim/collision.hpp"
#include "sim/world.hpp"

namespace botarena::sim {

// One tick for every projectile, in list order: TTL, advance, first contact against living non-shooter agents
// (silhouette test, radius fallback when the oracle has no mask), then the arena bounds check. Dead projectiles
// are removed before returning. An enemy standing inside 95% of a non-point-blank shooter's min range absorbs
// the round without damage.
void update_projectiles(World &w, CollisionProvider &oracle, CollisionProvider &fallback);

} // namespace botarena::sim
