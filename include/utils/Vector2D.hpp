/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>
#include <ostream>

// A simple 2D vector class
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    bool isZero() const { return m_x == 0.0f && m_y == 0.0f; }
    bool isFinite() const { return std::isfinite(m_x) && std::isfinite(m_y); }

    // Component-wise helpers used by the box math
    Vector2D abs() const { return Vector2D(std::fabs(m_x), std::fabs(m_y)); }
    static Vector2D min(const Vector2D& a, const Vector2D& b) {
        return Vector2D(std::fmin(a.m_x, b.m_x), std::fmin(a.m_y, b.m_y));
    }
    static Vector2D max(const Vector2D& a, const Vector2D& b) {
        return Vector2D(std::fmax(a.m_x, b.m_x), std::fmax(a.m_y, b.m_y));
    }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    friend Vector2D& operator+=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x += v2.m_x;
        v1.m_y += v2.m_y;
        return v1;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D operator-() const { return Vector2D(-m_x, -m_y); }

    friend Vector2D& operator-=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_y -= v2.m_y;
        return v1;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_y * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_y *= scalar;
        return *this;
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_y / scalar);
    }

    Vector2D& operator/=(float scalar) {
        m_x /= scalar;
        m_y /= scalar;
        return *this;
    }

    bool operator==(const Vector2D& other) const {
        return m_x == other.m_x && m_y == other.m_y;
    }
    bool operator!=(const Vector2D& other) const { return !(*this == other); }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    // Stream operator (for Boost.Test diagnostics)
    friend std::ostream& operator<<(std::ostream& os, const Vector2D& v) {
        return os << '(' << v.m_x << ", " << v.m_y << ')';
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
