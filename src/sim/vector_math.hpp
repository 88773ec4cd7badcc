// SPDX-License-Identifier: Apache-2.0
// vector_math.hpp - angle helpers on top of Box2D's b2Vec2 math.
// Angles are degrees, 0 = east (+x), 90 = +y (screen down). Positions are arena pixels.
#pragma once
#include <box2d/box2d.h>

#include <cmath>

namespace botarena::sim {

using Vec2 = b2Vec2;

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDegToRad = kPi / 180.f;
constexpr float kRadToDeg = 180.f / kPi;

inline Vec2 vec(float x, float y)
{
    return Vec2{x, y};
}

// Normalize to (-180, 180]. fmod keeps this O(1) for arbitrarily large inputs.
inline float wrap180(float deg)
{
    float r = std::fmod(deg + 180.f, 360.f);
    if (r <= 0.f)
        r += 360.f;
    return r - 180.f;
}

// Normalize to [0, 360).
inline float wrap360(float deg)
{
    float r = std::fmod(deg, 360.f);
    if (r < 0.f)
        r += 360.f;
    if (r >= 360.f)
        r -= 360.f;
    return r;
}

inline float angle_diff_abs(float a, float b)
{
    return std::fabs(wrap180(a - b));
}

// Bearing from `from` to `to` in degrees, [0, 360).
inline float angle_to(Vec2 from, Vec2 to)
{
    Vec2 d = b2Sub(to, from);
    return wrap360(std::atan2(d.y, d.x) * kRadToDeg);
}

inline Vec2 direction(float deg)
{
    float r = deg * kDegToRad;
    return Vec2{std::cos(r), std::sin(r)};
}

inline b2Rot rotation(float deg)
{
    float r = deg * kDegToRad;
    return b2Rot{std::cos(r), std::sin(r)};
}

inline float heading(Vec2 v)
{
    return wrap360(std::atan2(v.y, v.x) * kRadToDeg);
}

inline Vec2 scaled(Vec2 v, float s)
{
    return b2MulSV(s, v);
}

// Box2D returns the zero vector for near-zero input; callers rely on that.
inline Vec2 unit(Vec2 v)
{
    return b2Normalize(v);
}

// Step `current` toward `desired` by at most `max_step` degrees; lands exactly on `desired` when within reach.
inline float rotate_towards(float current, float desired, float max_step)
{
    float diff = wrap180(desired - current);
    if (std::fabs(diff) <= max_step)
        return wrap360(desired);
    return wrap360(current + (diff > 0.f ? max_step : -max_step));
}

// Squared distance from p to the segment a->b; `t_out` receives the clamped projection parameter.
// Returns a negative value when the segment is degenerate.
inline float segment_distance_sq(Vec2 p, Vec2 a, Vec2 b, float *t_out = nullptr)
{
    Vec2 ab = b2Sub(b, a);
    float len_sq = b2Dot(ab, ab);
    if (len_sq == 0.f)
        return -1.f;
    float t = b2Dot(b2Sub(p, a), ab) / len_sq;
    t = t < 0.f ? 0.f : (t > 1.f ? 1.f : t);
    if (t_out)
        *t_out = t;
    Vec2 closest = b2MulAdd(a, t, ab);
    return b2DistanceSquared(p, closest);
}

inline bool inside(const b2AABB &box, Vec2 p)
{
    return p.x >= box.lowerBound.x && p.x <= box.upperBound.x && p.y >= box.lowerBound.y && p.y <= box.upperBound.y;
}

} // namespace botarena::sim
