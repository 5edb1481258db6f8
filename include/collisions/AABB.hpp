/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include <optional>
#include <utility>
#include "utils/Vector2D.hpp"

namespace BumperEngine {

// Corner/size form of a box, used for the overlap arithmetic
struct Rect {
    Vector2D corner; // minimum corner (left, top)
    Vector2D size;   // full extents

    Rect() = default;
    Rect(float x, float y, float w, float h) : corner(x, y), size(w, h) {}

    float left() const { return corner.getX(); }
    float right() const { return corner.getX() + size.getX(); }
    float top() const { return corner.getY(); }
    float bottom() const { return corner.getY() + size.getY(); }

    bool operator==(const Rect& other) const {
        return corner == other.corner && size == other.size;
    }
};

struct AABB {
    Vector2D center; // world center
    Vector2D size;   // full extents (w, h), never half extents

    AABB() = default;
    AABB(float cx, float cy, float w, float h) : center(cx, cy), size(w, h) {}
    AABB(const Vector2D& c, const Vector2D& s) : center(c), size(s) {}

    static AABB fromRect(const Rect& rect);
    Rect toRect() const;

    float left() const { return center.getX() - size.getX() * 0.5f; }
    float right() const { return center.getX() + size.getX() * 0.5f; }
    float top() const { return center.getY() - size.getY() * 0.5f; }
    float bottom() const { return center.getY() + size.getY() * 0.5f; }

    // (min corner, max corner)
    std::pair<Vector2D, Vector2D> corners() const;

    // Zero-size, negative or non-finite boxes take part in no overlap test
    bool isDegenerate() const;

    bool contains(const Vector2D& p) const;
    AABB translated(const Vector2D& delta) const { return AABB(center + delta, size); }

    // Smallest box holding both; a zero-size operand is ignored
    AABB unite(const AABB& other) const;
    // Grow to fit other without moving the center
    AABB dilate(const AABB& other) const;

    bool operator==(const AABB& other) const {
        return center == other.center && size == other.size;
    }
    bool operator!=(const AABB& other) const { return !(*this == other); }
};

/**
 * @brief Per-axis overlap of two boxes
 *
 * Returns the magnitude of intersection on each axis when both are >= 0.
 * Touching boxes report a zero component; the resolver treats that as
 * already separated. Returns nullopt when the boxes are apart on either
 * axis or when either box is degenerate. Symmetric in its arguments.
 */
std::optional<Vector2D> overlap(const AABB& a, const AABB& b);
std::optional<Vector2D> overlap(const Rect& a, const Rect& b);

} // namespace BumperEngine

#endif // AABB_HPP
