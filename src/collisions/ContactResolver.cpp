/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/ContactResolver.hpp"
#include <cmath>

namespace BumperEngine {

Vector2D ContactResolver::separation(const AABB& a, const AABB& b, const Vector2D& overlapAmount) {
    float x = std::fabs(overlapAmount.getX());
    float y = std::fabs(overlapAmount.getY());
    if (a.center.getX() < b.center.getX()) {
        x = -x;
    }
    if (a.center.getY() < b.center.getY()) {
        y = -y;
    }
    return Vector2D(x, y);
}

ContactResolver::Displacement ContactResolver::split(const Vector2D& separationA,
                                                     CollisionFlags a, CollisionFlags b) {
    if (a.isPushableSolid() && b.isPushableSolid()) {
        Vector2D half = separationA * 0.5f;
        return {half, -half};
    }
    if (!a.isPushable() && b.isPushable()) {
        return {Vector2D(), -separationA};
    }
    // a is pushable; it takes the whole push even when b is pushable too
    return {separationA, Vector2D()};
}

Vector2D ContactResolver::minimumAxis(const Vector2D& v) {
    if (std::fabs(v.getX()) <= std::fabs(v.getY())) {
        return Vector2D(v.getX(), 0.0f);
    }
    return Vector2D(0.0f, v.getY());
}

std::optional<ContactResolver::Displacement> ContactResolver::resolve(const AABB& boxA, CollisionFlags a,
                                                                      const AABB& boxB, CollisionFlags b,
                                                                      float epsilon) {
    if (!canResolve(a, b)) {
        return std::nullopt;
    }
    auto amount = overlap(boxA, boxB);
    if (!amount || !amount->isFinite()) {
        return std::nullopt;
    }
    if (std::fabs(amount->getX()) <= epsilon || std::fabs(amount->getY()) <= epsilon) {
        return std::nullopt;
    }

    Displacement d = split(separation(boxA, boxB, *amount), a, b);
    return Displacement{minimumAxis(d.a), minimumAxis(d.b)};
}

} // namespace BumperEngine
