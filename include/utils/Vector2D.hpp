/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VECTOR_2D_HPP
#define VECTOR_2D_HPP

#include <cmath>

// World-space position or displacement. x grows east, y grows south.
class Vector2D {
public:
    Vector2D() : m_x(0.0f), m_y(0.0f) {}
    Vector2D(float x, float y) : m_x(x), m_y(y) {}

    // Unit vector pointing along a facing angle in radians
    static Vector2D fromAngle(float angle) {
        return Vector2D(std::cos(angle), std::sin(angle));
    }

    float getX() const { return m_x; }
    float getY() const { return m_y; }
    void setX(float x) { m_x = x; }
    void setY(float y) { m_y = y; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_y * m_y; }
    float angle() const { return std::atan2(m_y, m_x); }

    Vector2D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 1e-8f) return Vector2D(0.0f, 0.0f);
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector2D(m_x * invLen, m_y * invLen);
    }

    // Perpendicular pointing to the right of this vector in screen space
    Vector2D perpendicular() const { return Vector2D(-m_y, m_x); }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_y * v2.m_y;
    }

    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_y + v2.m_y);
    }

    Vector2D& operator+=(const Vector2D& v2) {
        m_x += v2.m_x;
        m_y += v2.m_y;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_y - v2.m_y);
    }

    Vector2D& operator-=(const Vector2D& v2) {
        m_x -= v2.m_x;
        m_y -= v2.m_y;
        return *this;
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

    bool operator==(const Vector2D& other) const {
        return m_x == other.m_x && m_y == other.m_y;
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dy = a.m_y - b.m_y;
        return dx * dx + dy * dy;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

    static Vector2D lerp(const Vector2D& a, const Vector2D& b, float t) {
        return Vector2D(a.m_x + (b.m_x - a.m_x) * t, a.m_y + (b.m_y - a.m_y) * t);
    }

private:
    float m_x{0.0f};
    float m_y{0.0f};
};

#endif  // VECTOR_2D_HPP
