// SPDX-License-Identifier: MIT
// Position in 2D space.
// Copyright (C) 2026 rectkit contributors

#include "pos.hpp"

#include "check.hpp"
#include "rect.hpp"
#include "scalar.hpp"

#include <algorithm>
#include <numbers>
#include <numeric>

const Pos Pos::zero = { 0, 0 };
const Pos Pos::one = { 1, 1 };
const Pos Pos::half = { 0.5f, 0.5f };
const Pos Pos::neg_one = { -1, -1 };
const Pos Pos::unit_x = { 1, 0 };
const Pos Pos::unit_y = { 0, 1 };

Pos Pos::from_angle(const float angle)
{
    return { std::cos(angle), std::sin(angle) };
}

Pos Pos::rem_euclid_dims(const float rx, const float ry) const
{
    return { ::rem_euclid(x, rx), ::rem_euclid(y, ry) };
}

Pos Pos::div_euclid_dims(const float dx, const float dy) const
{
    return { ::div_euclid(x, dx), ::div_euclid(y, dy) };
}

Pos Pos::mul_add(const Pos& mul, const Pos& add) const
{
    return { std::fma(x, mul.x, add.x), std::fma(y, mul.y, add.y) };
}

float Pos::length() const
{
    return std::sqrt(length_squared());
}

float Pos::distance(const Pos& other) const
{
    return std::sqrt(distance_squared(other));
}

float Pos::angle() const
{
    // screen y axis points down
    return std::atan2(-y, x);
}

float Pos::normalized_angle() const
{
    return normalize_angle(angle());
}

Cardinal Pos::cardinal() const
{
    constexpr float pi = std::numbers::pi_v<float>;
    const float theta = normalize_angle(normalized_angle() + pi / 8);
    const int octant = static_cast<int>(std::floor(theta / (pi / 4))) & 7;
    return static_cast<Cardinal>(octant);
}

Axial Pos::axial() const
{
    constexpr float pi = std::numbers::pi_v<float>;
    const float theta = normalized_angle();
    const int quadrant =
        static_cast<int>(std::floor((theta + pi / 4) / (pi / 2))) & 3;
    return static_cast<Axial>(quadrant);
}

Pos Pos::normalized() const
{
    const float len = length();
    return { x / len, y / len };
}

Pos Pos::reflect(const Pos& normal) const
{
    return *this - normal * (2.0f * dot(normal));
}

Pos Pos::rotate_by(const Pos& rhs) const
{
    return { x * rhs.x - y * rhs.y, y * rhs.x + x * rhs.y };
}

Pos Pos::lerp(const Pos& other, const float t) const
{
    return { ::lerp(x, other.x, t), ::lerp(y, other.y, t) };
}

Pos Pos::clamped_lerp(const Pos& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

Pos Pos::mid_point(const Pos& other) const
{
    return { std::midpoint(x, other.x), std::midpoint(y, other.y) };
}

Pos Pos::clamp(const Pos& min, const Pos& max) const
{
    RECTKIT_CHECK(min.le(max), "clamp bounds are inverted");
    return { std::clamp(x, min.x, max.x), std::clamp(y, min.y, max.y) };
}

Pos Pos::clamp_both(const float min, const float max) const
{
    return { std::clamp(x, min, max), std::clamp(y, min, max) };
}

Pos Pos::clamp_length(const float min, const float max) const
{
    const float len = length();
    if (len >= min && len <= max) {
        return *this;
    }
    return *this * (std::clamp(len, min, max) / len);
}

Pos Pos::clamp_length_min(const float min) const
{
    const float len = length();
    if (len >= min) {
        return *this;
    }
    return *this * (min / len);
}

Pos Pos::clamp_length_max(const float max) const
{
    const float len = length();
    if (len <= max) {
        return *this;
    }
    return *this * (max / len);
}

Pos Pos::min(const Pos& rhs) const
{
    return { std::fmin(x, rhs.x), std::fmin(y, rhs.y) };
}

Pos Pos::max(const Pos& rhs) const
{
    return { std::fmax(x, rhs.x), std::fmax(y, rhs.y) };
}

Pos Pos::floor() const
{
    return { std::floor(x), std::floor(y) };
}

Pos Pos::ceil() const
{
    return { std::ceil(x), std::ceil(y) };
}

Pos Pos::round() const
{
    return { std::round(x), std::round(y) };
}

Pos Pos::trunc() const
{
    return { std::trunc(x), std::trunc(y) };
}

Pos Pos::fract() const
{
    return { x - std::trunc(x), y - std::trunc(y) };
}

Pos Pos::abs() const
{
    return { std::fabs(x), std::fabs(y) };
}

/** Sign of the value: 1 or -1 (including zeros), NaN for NaN. */
static float sign_of(const float value)
{
    return std::isnan(value) ? value : std::copysign(1.0f, value);
}

Pos Pos::signum() const
{
    return { sign_of(x), sign_of(y) };
}

Pos Pos::recip() const
{
    return { 1.0f / x, 1.0f / y };
}

Pos Pos::copysign(const Pos& sign) const
{
    return { std::copysign(x, sign.x), std::copysign(y, sign.y) };
}

Pos Pos::to_degrees() const
{
    constexpr float factor = 180.0f / std::numbers::pi_v<float>;
    return { x * factor, y * factor };
}

Pos Pos::to_radians() const
{
    constexpr float factor = std::numbers::pi_v<float> / 180.0f;
    return { x * factor, y * factor };
}

Pos Pos::snap_to_rect(const Rect& rect) const
{
    return rect.closest_point(*this);
}

std::partial_ordering Pos::compare(const Pos& other) const
{
    if (eq(other)) {
        return std::partial_ordering::equivalent;
    }
    if (le(other)) {
        return std::partial_ordering::less;
    }
    if (ge(other)) {
        return std::partial_ordering::greater;
    }
    return std::partial_ordering::unordered;
}
