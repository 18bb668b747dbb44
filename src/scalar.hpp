// SPDX-License-Identifier: MIT
// Scalar helpers shared by geometry types.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include <cmath>
#include <numbers>

/**
 * Linear interpolation.
 * @param a,b range bounds
 * @param t interpolation factor
 * @return a + (b - a) * t
 */
inline float lerp(const float a, const float b, const float t)
{
    return a + (b - a) * t;
}

inline float half(const float value)
{
    return value * 0.5f;
}

inline bool is_positive(const float value)
{
    return value >= 0.0f;
}

/**
 * Euclidean remainder, result is always in [0, |rhs|).
 */
inline float rem_euclid(const float lhs, const float rhs)
{
    const float rem = std::fmod(lhs, rhs);
    return rem < 0.0f ? rem + std::fabs(rhs) : rem;
}

/**
 * Euclidean division, the counterpart of rem_euclid().
 */
inline float div_euclid(const float lhs, const float rhs)
{
    const float quot = std::trunc(lhs / rhs);
    if (std::fmod(lhs, rhs) < 0.0f) {
        return rhs > 0.0f ? quot - 1.0f : quot + 1.0f;
    }
    return quot;
}

/**
 * Wrap angle into [0, 2*pi).
 * @param angle angle in radians
 * @return normalized angle
 */
inline float normalize_angle(const float angle)
{
    constexpr float tau = 2.0f * std::numbers::pi_v<float>;
    return rem_euclid(angle, tau);
}
