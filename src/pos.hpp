// SPDX-License-Identifier: MIT
// Position in 2D space.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include "check.hpp"
#include "direction.hpp"
#include "size.hpp"

#include <array>
#include <cmath>
#include <compare>
#include <cstddef>
#include <utility>

struct Rect;

/**
 * Coordinates in 2D: x grows to the right, y grows down.
 * Relational operators compare both axes at once, so positions are only
 * partially ordered.
 */
struct Pos {
    float x = 0;
    float y = 0;

    /**
     * Create position with both coordinates set to the same value.
     * @param value coordinate value
     */
    static inline Pos splat(const float value) { return { value, value }; }

    /**
     * Create unit vector for the angle.
     * @param angle angle in radians
     * @return (cos, sin)
     */
    static Pos from_angle(const float angle);

    static inline Pos from_array(const std::array<float, 2>& arr)
    {
        return { arr[0], arr[1] };
    }

    static inline Pos from_pair(const std::pair<float, float>& pair)
    {
        return { pair.first, pair.second };
    }

    inline std::array<float, 2> to_array() const { return { x, y }; }
    inline std::pair<float, float> to_pair() const { return { x, y }; }

    /**
     * Get position with swapped coordinates.
     */
    inline Pos yx() const { return { y, x }; }

    inline Pos with_x(const float value) const { return { value, y }; }
    inline Pos with_y(const float value) const { return { x, value }; }

    // Primitive arithmetic, all operators are built on top of these

    inline Pos add_dims(const float dx, const float dy) const
    {
        return { x + dx, y + dy };
    }

    inline Pos sub_dims(const float dx, const float dy) const
    {
        return { x - dx, y - dy };
    }

    inline Pos mul_dims(const float mx, const float my) const
    {
        return { x * mx, y * my };
    }

    inline Pos div_dims(const float dx, const float dy) const
    {
        return { x / dx, y / dy };
    }

    inline Pos rem_dims(const float rx, const float ry) const
    {
        return { std::fmod(x, rx), std::fmod(y, ry) };
    }

    Pos rem_euclid_dims(const float rx, const float ry) const;
    Pos div_euclid_dims(const float dx, const float dy) const;

    inline Pos rem_euclid(const Pos& rhs) const
    {
        return rem_euclid_dims(rhs.x, rhs.y);
    }

    inline Pos div_euclid(const Pos& rhs) const
    {
        return div_euclid_dims(rhs.x, rhs.y);
    }

    /**
     * Fused multiply-add: self * mul + add.
     */
    Pos mul_add(const Pos& mul, const Pos& add) const;

    inline Pos negated() const { return { -x, -y }; }

    // Vector queries

    inline float length_squared() const { return x * x + y * y; }
    float length() const;

    inline float distance_squared(const Pos& other) const
    {
        return other.sub_dims(x, y).length_squared();
    }
    float distance(const Pos& other) const;

    inline float dot(const Pos& other) const
    {
        return x * other.x + y * other.y;
    }

    inline float cross(const Pos& other) const
    {
        return x * other.y - y * other.x;
    }

    /**
     * Get angle of the vector, counter-clockwise from the x axis as seen
     * on screen (y axis points down).
     * @return angle in radians within [-pi, pi]
     */
    float angle() const;

    /**
     * Get angle wrapped into [0, 2*pi).
     */
    float normalized_angle() const;

    /**
     * Get compass octant of the vector direction.
     * @return one of eight 45 degree wide sectors
     */
    Cardinal cardinal() const;

    /**
     * Get axis-aligned quadrant of the vector direction.
     * @return one of four 90 degree wide sectors
     */
    Axial axial() const;

    /**
     * Get unit vector with the same direction.
     * Zero vector gives NaN coordinates.
     */
    Pos normalized() const;

    /** Rotate by 90 degrees clockwise (as seen on screen). */
    inline Pos perp_cw() const { return { -y, x }; }
    /** Rotate by 90 degrees counter-clockwise (as seen on screen). */
    inline Pos perp_ccw() const { return { y, -x }; }

    /**
     * Reflect vector from the surface, both vectors must be normalized.
     * @param normal surface normal
     */
    Pos reflect(const Pos& normal) const;

    /**
     * Rotate by the rotation of another unit vector.
     * @param rhs unit vector describing rotation
     */
    Pos rotate_by(const Pos& rhs) const;

    // Interpolation and clamping

    Pos lerp(const Pos& other, const float t) const;
    Pos clamped_lerp(const Pos& other, const float t) const;

    /**
     * Get point exactly between two points.
     */
    Pos mid_point(const Pos& other) const;

    /**
     * Clamp coordinates into the box.
     * @param min,max box bounds, min must not be greater than max
     */
    Pos clamp(const Pos& min, const Pos& max) const;
    Pos clamp_both(const float min, const float max) const;
    inline Pos clamp_uv() const { return clamp_both(0, 1); }

    /**
     * Scale vector so that its length is within the range.
     * Zero vector gives NaN coordinates.
     * @param min,max length range
     */
    Pos clamp_length(const float min, const float max) const;
    Pos clamp_length_min(const float min) const;
    Pos clamp_length_max(const float max) const;

    // Component-wise helpers

    Pos min(const Pos& rhs) const;
    Pos max(const Pos& rhs) const;

    /**
     * Get component-wise minimum and maximum.
     * @return pair of (min, max)
     */
    inline std::pair<Pos, Pos> min_max(const Pos& rhs) const
    {
        return { min(rhs), max(rhs) };
    }

    Pos floor() const;
    Pos ceil() const;
    Pos round() const;
    Pos trunc() const;
    Pos fract() const;
    Pos abs() const;
    Pos signum() const;
    Pos recip() const;
    Pos copysign(const Pos& sign) const;
    Pos to_degrees() const;
    Pos to_radians() const;

    inline bool is_finite() const
    {
        return std::isfinite(x) && std::isfinite(y);
    }

    inline bool is_nan() const { return std::isnan(x) || std::isnan(y); }

    /**
     * Get nearest point on the rectangle boundary or inside it.
     * @param rect target rectangle
     */
    Pos snap_to_rect(const Rect& rect) const;

    // Two-axis comparison

    /** Check that x < other.x and y < other.y. */
    inline bool lt(const Pos& other) const
    {
        return x < other.x && y < other.y;
    }

    /** Check that x <= other.x and y <= other.y. */
    inline bool le(const Pos& other) const
    {
        return x <= other.x && y <= other.y;
    }

    /** Check that x == other.x and y == other.y. */
    inline bool eq(const Pos& other) const
    {
        return x == other.x && y == other.y;
    }

    /** Check that x >= other.x and y >= other.y. */
    inline bool ge(const Pos& other) const
    {
        return x >= other.x && y >= other.y;
    }

    /** Check that x > other.x and y > other.y. */
    inline bool gt(const Pos& other) const
    {
        return x > other.x && y > other.y;
    }

    /**
     * Compare positions on both axes.
     * @param other position to compare with
     * @return unordered if neither le() nor ge() holds
     */
    std::partial_ordering compare(const Pos& other) const;

    bool operator==(const Pos&) const = default;
    inline bool operator<(const Pos& rhs) const { return lt(rhs); }
    inline bool operator<=(const Pos& rhs) const { return le(rhs); }
    inline bool operator>(const Pos& rhs) const { return gt(rhs); }
    inline bool operator>=(const Pos& rhs) const { return ge(rhs); }

    // Operators

    inline float operator[](const size_t index) const
    {
        RECTKIT_CHECK(index < 2, "position index out of range");
        return index == 0 ? x : y;
    }

    inline float& operator[](const size_t index)
    {
        RECTKIT_CHECK(index < 2, "position index out of range");
        return index == 0 ? x : y;
    }

    inline Pos operator-() const { return negated(); }

    inline Pos operator+(const Pos& rhs) const
    {
        return add_dims(rhs.x, rhs.y);
    }
    inline Pos operator+(const Size& rhs) const
    {
        return add_dims(rhs.width, rhs.height);
    }
    inline Pos operator+(const float rhs) const { return add_dims(rhs, rhs); }
    inline Pos operator+(const std::pair<float, float>& rhs) const
    {
        return add_dims(rhs.first, rhs.second);
    }
    inline Pos operator+(const std::array<float, 2>& rhs) const
    {
        return add_dims(rhs[0], rhs[1]);
    }

    inline Pos operator-(const Pos& rhs) const
    {
        return sub_dims(rhs.x, rhs.y);
    }
    inline Pos operator-(const Size& rhs) const
    {
        return sub_dims(rhs.width, rhs.height);
    }
    inline Pos operator-(const float rhs) const { return sub_dims(rhs, rhs); }
    inline Pos operator-(const std::pair<float, float>& rhs) const
    {
        return sub_dims(rhs.first, rhs.second);
    }
    inline Pos operator-(const std::array<float, 2>& rhs) const
    {
        return sub_dims(rhs[0], rhs[1]);
    }

    inline Pos operator*(const Pos& rhs) const
    {
        return mul_dims(rhs.x, rhs.y);
    }
    inline Pos operator*(const Size& rhs) const
    {
        return mul_dims(rhs.width, rhs.height);
    }
    inline Pos operator*(const float rhs) const { return mul_dims(rhs, rhs); }
    inline Pos operator*(const std::pair<float, float>& rhs) const
    {
        return mul_dims(rhs.first, rhs.second);
    }
    inline Pos operator*(const std::array<float, 2>& rhs) const
    {
        return mul_dims(rhs[0], rhs[1]);
    }

    inline Pos operator/(const Pos& rhs) const
    {
        return div_dims(rhs.x, rhs.y);
    }
    inline Pos operator/(const Size& rhs) const
    {
        return div_dims(rhs.width, rhs.height);
    }
    inline Pos operator/(const float rhs) const { return div_dims(rhs, rhs); }
    inline Pos operator/(const std::pair<float, float>& rhs) const
    {
        return div_dims(rhs.first, rhs.second);
    }
    inline Pos operator/(const std::array<float, 2>& rhs) const
    {
        return div_dims(rhs[0], rhs[1]);
    }

    inline Pos operator%(const Pos& rhs) const
    {
        return rem_dims(rhs.x, rhs.y);
    }
    inline Pos operator%(const Size& rhs) const
    {
        return rem_dims(rhs.width, rhs.height);
    }
    inline Pos operator%(const float rhs) const { return rem_dims(rhs, rhs); }
    inline Pos operator%(const std::pair<float, float>& rhs) const
    {
        return rem_dims(rhs.first, rhs.second);
    }
    inline Pos operator%(const std::array<float, 2>& rhs) const
    {
        return rem_dims(rhs[0], rhs[1]);
    }

    inline Pos& operator+=(const Pos& rhs) { return *this = *this + rhs; }
    inline Pos& operator-=(const Pos& rhs) { return *this = *this - rhs; }
    inline Pos& operator*=(const float rhs) { return *this = *this * rhs; }
    inline Pos& operator/=(const float rhs) { return *this = *this / rhs; }

    // Common positions
    static const Pos zero;
    static const Pos one;
    static const Pos half;
    static const Pos neg_one;
    static const Pos unit_x;
    static const Pos unit_y;
};
