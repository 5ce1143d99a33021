/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace NightCage {

struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(const Vector2D& c, float halfExtent) : center(c), halfSize(halfExtent, halfExtent) {}
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    AABB translated(const Vector2D& offset) const {
        return AABB(center.getX() + offset.getX(), center.getY() + offset.getY(),
                    halfSize.getX(), halfSize.getY());
    }

    // Edges inclusive
    bool contains(const Vector2D& p) const {
        return p.getX() >= left() && p.getX() <= right() &&
               p.getY() >= top() && p.getY() <= bottom();
    }
};

} // namespace NightCage

#endif // AABB_HPP
