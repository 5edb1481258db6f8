/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace BumperEngine {

AABB AABB::fromRect(const Rect& rect) {
    return AABB(rect.corner + rect.size * 0.5f, rect.size);
}

Rect AABB::toRect() const {
    Rect rect;
    rect.corner = center - size * 0.5f;
    rect.size = size;
    return rect;
}

std::pair<Vector2D, Vector2D> AABB::corners() const {
    Vector2D half = size * 0.5f;
    return {center - half, center + half};
}

bool AABB::isDegenerate() const {
    if (!center.isFinite() || !size.isFinite()) return true;
    return size.getX() <= 0.0f || size.getY() <= 0.0f;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

AABB AABB::unite(const AABB& other) const {
    if (size.length() < FLT_EPSILON) return other;
    if (other.size.length() < FLT_EPSILON) return *this;

    auto [minA, maxA] = corners();
    auto [minB, maxB] = other.corners();
    Vector2D lo = Vector2D::min(minA, minB);
    Vector2D hi = Vector2D::max(maxA, maxB);
    Vector2D extent = hi - lo;
    return AABB(lo + extent * 0.5f, extent);
}

AABB AABB::dilate(const AABB& other) const {
    auto [lo, hi] = other.corners();
    float w = std::max({(center.getX() - lo.getX()) * 2.0f,
                        (hi.getX() - center.getX()) * 2.0f,
                        size.getX()});
    float h = std::max({(center.getY() - lo.getY()) * 2.0f,
                        (hi.getY() - center.getY()) * 2.0f,
                        size.getY()});
    return AABB(center, Vector2D(w, h));
}

std::optional<Vector2D> overlap(const Rect& a, const Rect& b) {
    float xOverlap = std::min(a.right(), b.right()) - std::max(a.left(), b.left());
    float yOverlap = std::min(a.bottom(), b.bottom()) - std::max(a.top(), b.top());
    if (xOverlap >= 0.0f && yOverlap >= 0.0f) {
        return Vector2D(xOverlap, yOverlap);
    }
    return std::nullopt;
}

std::optional<Vector2D> overlap(const AABB& a, const AABB& b) {
    if (a.isDegenerate() || b.isDegenerate()) {
        return std::nullopt;
    }
    auto result = overlap(a.toRect(), b.toRect());
    if (result && !result->isFinite()) {
        return std::nullopt;
    }
    return result;
}

} // namespace BumperEngine
