/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionSettings.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>

namespace BumperEngine {

namespace {
[[noreturn]] void reject(const std::string& message) {
    COLLISION_ERROR(message);
    throw std::invalid_argument(message);
}
} // namespace

void CollisionSettings::validate() const {
    if (!(fineCellSize > 0.0f) || !std::isfinite(fineCellSize)) {
        reject(std::format("Invalid fineCellSize {}: must be positive", fineCellSize));
    }
    if (coarseCellFactor < 1) {
        reject(std::format("Invalid coarseCellFactor {}: must be at least 1", coarseCellFactor));
    }
    if (iterations == 0) {
        reject("Invalid iterations 0: at least one resolution pass is required");
    }
    if (!(overlapEpsilon >= 0.0f) || !std::isfinite(overlapEpsilon)) {
        reject(std::format("Invalid overlapEpsilon {}: must be finite and non-negative", overlapEpsilon));
    }
    if (!(fragmentationThreshold > 0.0f) || fragmentationThreshold > 1.0f) {
        reject(std::format("Invalid fragmentationThreshold {}: must be in (0, 1]", fragmentationThreshold));
    }
    if (!(rebuildFraction >= 0.0f) || !std::isfinite(rebuildFraction)) {
        reject(std::format("Invalid rebuildFraction {}: must be finite and non-negative", rebuildFraction));
    }
}

} // namespace BumperEngine
