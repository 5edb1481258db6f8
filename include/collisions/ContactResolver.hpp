/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTACT_RESOLVER_HPP
#define CONTACT_RESOLVER_HPP

#include <optional>
#include "collisions/AABB.hpp"
#include "collisions/CollisionPolicy.hpp"

namespace BumperEngine {

/**
 * @brief Narrow-phase response for one physical pair
 *
 * Both objects of a pair are passed in canonical contact order. The result
 * says how far each of them has to move; each vector has at most one
 * non-zero axis.
 */
class ContactResolver {
public:
    struct Displacement {
        Vector2D a;
        Vector2D b;
    };

    // A pair can only ever move if one side obstructs and one side yields
    static bool canResolve(CollisionFlags a, CollisionFlags b) {
        return (a.isSolid() || b.isSolid()) && (a.isPushable() || b.isPushable());
    }

    /**
     * @brief Separation vector for a, signed away from b on both axes
     *
     * The x component is negative when a's center lies left of b's, the y
     * component negative when a's center lies above b's.
     */
    static Vector2D separation(const AABB& a, const AABB& b, const Vector2D& overlapAmount);

    /**
     * @brief Splits a separation between the two objects
     *
     * Both SOLID|PUSHABLE: half each, in opposite directions. Exactly one
     * pushable: it takes everything. Any other pushable pair: a, the
     * canonical-first object, takes everything.
     */
    static Displacement split(const Vector2D& separationA, CollisionFlags a, CollisionFlags b);

    // Keeps only the axis with the smaller magnitude; ties keep x
    static Vector2D minimumAxis(const Vector2D& v);

    /**
     * @brief Full response for the current boxes
     *
     * nullopt when the pair cannot move, the boxes no longer overlap, the
     * overlap is non-finite, or either axis is within epsilon (already
     * resolved).
     */
    static std::optional<Displacement> resolve(const AABB& boxA, CollisionFlags a,
                                               const AABB& boxB, CollisionFlags b,
                                               float epsilon);
};

} // namespace BumperEngine

#endif // CONTACT_RESOLVER_HPP
