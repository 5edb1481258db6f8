/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_SETTINGS_HPP
#define COLLISION_SETTINGS_HPP

#include <cfloat>
#include <cstddef>
#include <cstdint>
#include "collisions/SpatialGrid.hpp"

namespace BumperEngine {

/**
 * @brief Tunables of a CollisionWorld
 *
 * Cell sizes only change performance. iterations and overlapEpsilon trade
 * convergence quality against per-tick cost.
 */
struct CollisionSettings {
    float fineCellSize{SpatialGrid::DEFAULT_FINE_CELL_SIZE};
    int32_t coarseCellFactor{SpatialGrid::DEFAULT_COARSE_FACTOR};

    size_t iterations{3};            // resolution passes per tick
    float overlapEpsilon{FLT_EPSILON}; // overlap at or below this counts as resolved

    size_t bruteForceThreshold{16};  // all-pairs testing up to this many indexed objects
    size_t shrinkInterval{300};      // ticks between grid compactions, 0 disables
    float fragmentationThreshold{0.5f};
    float rebuildFraction{0.5f};     // structural changes per live object that force a rebuild

    /**
     * @brief Checks every field
     * @throws std::invalid_argument naming the first bad field
     */
    void validate() const;
};

} // namespace BumperEngine

#endif // COLLISION_SETTINGS_HPP
