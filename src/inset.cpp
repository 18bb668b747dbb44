// SPDX-License-Identifier: MIT
// Four-sided insets: margin (grows a rectangle) and padding (shrinks it).
// Copyright (C) 2026 rectkit contributors

#include "inset.hpp"

#include "scalar.hpp"

#include <algorithm>
#include <bit>
#include <limits>

// margin and padding are relabeled by copying bits
static_assert(sizeof(Margin) == sizeof(Padding));
static_assert(sizeof(Marginf) == sizeof(Paddingf));
static_assert(sizeof(Margin) == 4 * sizeof(int8_t));
static_assert(sizeof(Marginf) == 4 * sizeof(float));

const Margin Margin::zero = Margin::same(0);
const Margin Margin::neg_one = Margin::same(-1);
const Margin Margin::s1 = Margin::same(1);
const Margin Margin::s2 = Margin::same(2);
const Margin Margin::s3 = Margin::same(3);
const Margin Margin::s4 = Margin::same(4);
const Margin Margin::s5 = Margin::same(5);
const Margin Margin::s6 = Margin::same(6);
const Margin Margin::s8 = Margin::same(8);
const Margin Margin::s10 = Margin::same(10);
const Margin Margin::s15 = Margin::same(15);
const Margin Margin::s16 = Margin::same(16);
const Margin Margin::s18 = Margin::same(18);
const Margin Margin::s20 = Margin::same(20);
const Margin Margin::s22 = Margin::same(22);
const Margin Margin::s24 = Margin::same(24);
const Margin Margin::s25 = Margin::same(25);
const Margin Margin::s28 = Margin::same(28);
const Margin Margin::s32 = Margin::same(32);
const Margin Margin::s40 = Margin::same(40);
const Margin Margin::s50 = Margin::same(50);
const Margin Margin::s75 = Margin::same(75);
const Margin Margin::s100 = Margin::same(100);
const Margin Margin::min = Margin::same(std::numeric_limits<int8_t>::min());
const Margin Margin::max = Margin::same(std::numeric_limits<int8_t>::max());

const Padding Padding::zero = Padding::same(0);
const Padding Padding::neg_one = Padding::same(-1);
const Padding Padding::s1 = Padding::same(1);
const Padding Padding::s2 = Padding::same(2);
const Padding Padding::s3 = Padding::same(3);
const Padding Padding::s4 = Padding::same(4);
const Padding Padding::s5 = Padding::same(5);
const Padding Padding::s6 = Padding::same(6);
const Padding Padding::s8 = Padding::same(8);
const Padding Padding::s10 = Padding::same(10);
const Padding Padding::s15 = Padding::same(15);
const Padding Padding::s16 = Padding::same(16);
const Padding Padding::s18 = Padding::same(18);
const Padding Padding::s20 = Padding::same(20);
const Padding Padding::s22 = Padding::same(22);
const Padding Padding::s24 = Padding::same(24);
const Padding Padding::s25 = Padding::same(25);
const Padding Padding::s28 = Padding::same(28);
const Padding Padding::s32 = Padding::same(32);
const Padding Padding::s40 = Padding::same(40);
const Padding Padding::s50 = Padding::same(50);
const Padding Padding::s75 = Padding::same(75);
const Padding Padding::s100 = Padding::same(100);
const Padding Padding::min = Padding::same(std::numeric_limits<int8_t>::min());
const Padding Padding::max = Padding::same(std::numeric_limits<int8_t>::max());

/**
 * Truncate interpolated value back to inset integer.
 * @param a,b range bounds
 * @param t interpolation factor
 * @return saturated integer value
 */
static int8_t lerp_side(const int8_t a, const int8_t b, const float t)
{
    constexpr float lo = std::numeric_limits<int8_t>::min();
    constexpr float hi = std::numeric_limits<int8_t>::max();
    const float value = lerp(a, b, t);
    if (std::isnan(value)) {
        return 0;
    }
    return static_cast<int8_t>(std::clamp(value, lo, hi));
}

Margin Margin::operator+(const Margin& rhs) const
{
    return { static_cast<int8_t>(left + rhs.left),
             static_cast<int8_t>(top + rhs.top),
             static_cast<int8_t>(right + rhs.right),
             static_cast<int8_t>(bottom + rhs.bottom) };
}

Margin Margin::operator-(const Margin& rhs) const
{
    return { static_cast<int8_t>(left - rhs.left),
             static_cast<int8_t>(top - rhs.top),
             static_cast<int8_t>(right - rhs.right),
             static_cast<int8_t>(bottom - rhs.bottom) };
}

Margin Margin::lerp(const Margin& other, const float t) const
{
    return { lerp_side(left, other.left, t), lerp_side(top, other.top, t),
             lerp_side(right, other.right, t),
             lerp_side(bottom, other.bottom, t) };
}

Margin Margin::clamped_lerp(const Margin& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

Marginf Margin::to_marginf() const
{
    return { leftf(), topf(), rightf(), bottomf() };
}

Padding Margin::to_padding() const
{
    return std::bit_cast<Padding>(*this);
}

Margin Margin::from_padding(const Padding& padding)
{
    return std::bit_cast<Margin>(padding);
}

Padding Padding::operator+(const Padding& rhs) const
{
    return { static_cast<int8_t>(left + rhs.left),
             static_cast<int8_t>(top + rhs.top),
             static_cast<int8_t>(right + rhs.right),
             static_cast<int8_t>(bottom + rhs.bottom) };
}

Padding Padding::operator-(const Padding& rhs) const
{
    return { static_cast<int8_t>(left - rhs.left),
             static_cast<int8_t>(top - rhs.top),
             static_cast<int8_t>(right - rhs.right),
             static_cast<int8_t>(bottom - rhs.bottom) };
}

Padding Padding::lerp(const Padding& other, const float t) const
{
    return { lerp_side(left, other.left, t), lerp_side(top, other.top, t),
             lerp_side(right, other.right, t),
             lerp_side(bottom, other.bottom, t) };
}

Padding Padding::clamped_lerp(const Padding& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

Paddingf Padding::to_paddingf() const
{
    return { leftf(), topf(), rightf(), bottomf() };
}

Margin Padding::to_margin() const
{
    return std::bit_cast<Margin>(*this);
}

Padding Padding::from_margin(const Margin& margin)
{
    return std::bit_cast<Padding>(margin);
}

Marginf Marginf::operator+(const Marginf& rhs) const
{
    return { left + rhs.left, top + rhs.top, right + rhs.right,
             bottom + rhs.bottom };
}

Marginf Marginf::operator-(const Marginf& rhs) const
{
    return { left - rhs.left, top - rhs.top, right - rhs.right,
             bottom - rhs.bottom };
}

Marginf Marginf::lerp(const Marginf& other, const float t) const
{
    return { ::lerp(left, other.left, t), ::lerp(top, other.top, t),
             ::lerp(right, other.right, t), ::lerp(bottom, other.bottom, t) };
}

Marginf Marginf::clamped_lerp(const Marginf& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

Paddingf Marginf::to_padding() const
{
    return std::bit_cast<Paddingf>(*this);
}

Marginf Marginf::from_padding(const Paddingf& padding)
{
    return std::bit_cast<Marginf>(padding);
}

Paddingf Paddingf::operator+(const Paddingf& rhs) const
{
    return { left + rhs.left, top + rhs.top, right + rhs.right,
             bottom + rhs.bottom };
}

Paddingf Paddingf::operator-(const Paddingf& rhs) const
{
    return { left - rhs.left, top - rhs.top, right - rhs.right,
             bottom - rhs.bottom };
}

Paddingf Paddingf::lerp(const Paddingf& other, const float t) const
{
    return { ::lerp(left, other.left, t), ::lerp(top, other.top, t),
             ::lerp(right, other.right, t), ::lerp(bottom, other.bottom, t) };
}

Paddingf Paddingf::clamped_lerp(const Paddingf& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

Marginf Paddingf::to_margin() const
{
    return std::bit_cast<Marginf>(*this);
}

Paddingf Paddingf::from_margin(const Marginf& margin)
{
    return std::bit_cast<Paddingf>(margin);
}
