// SPDX-License-Identifier: MIT
// Four-sided insets: margin (grows a rectangle) and padding (shrinks it).
// Copyright (C) 2026 rectkit contributors

#pragma once

#include <cstdint>

struct Padding;
struct Marginf;
struct Paddingf;

/** Integer margin, grows a rectangle outward when applied. */
struct Margin {
    int8_t left = 0;
    int8_t top = 0;
    int8_t right = 0;
    int8_t bottom = 0;

    /**
     * Create margin with the same value on each side.
     * @param all inset value
     */
    static constexpr Margin same(const int8_t all)
    {
        return { all, all, all, all };
    }

    /**
     * Create margin with the same horizontal and vertical sides.
     * @param x left and right value
     * @param y top and bottom value
     */
    static constexpr Margin symmetric(const int8_t x, const int8_t y)
    {
        return { x, y, x, y };
    }

    /**
     * Get total horizontal inset.
     * @return left + right
     */
    inline int16_t x() const { return int16_t(left) + int16_t(right); }

    /**
     * Get total vertical inset.
     * @return top + bottom
     */
    inline int16_t y() const { return int16_t(top) + int16_t(bottom); }

    inline float leftf() const { return left; }
    inline float topf() const { return top; }
    inline float rightf() const { return right; }
    inline float bottomf() const { return bottom; }

    Margin operator+(const Margin& rhs) const;
    Margin operator-(const Margin& rhs) const;

    bool operator==(const Margin&) const = default;

    /**
     * Interpolate between two margins.
     * Sides are truncated (and saturated) back to integers.
     * @param other target margin
     * @param t interpolation factor
     * @return interpolated margin
     */
    Margin lerp(const Margin& other, const float t) const;

    /**
     * Interpolate with factor clamped to [0, 1].
     */
    Margin clamped_lerp(const Margin& other, const float t) const;

    /**
     * Convert to float margin.
     */
    Marginf to_marginf() const;

    /**
     * Reinterpret as padding, field values are kept as is.
     */
    Padding to_padding() const;

    /**
     * Reinterpret padding as margin, field values are kept as is.
     */
    static Margin from_padding(const Padding& padding);

    // Equal insets on every side, min and max are the int8 limits
    static const Margin zero;
    static const Margin neg_one;
    static const Margin s1;
    static const Margin s2;
    static const Margin s3;
    static const Margin s4;
    static const Margin s5;
    static const Margin s6;
    static const Margin s8;
    static const Margin s10;
    static const Margin s15;
    static const Margin s16;
    static const Margin s18;
    static const Margin s20;
    static const Margin s22;
    static const Margin s24;
    static const Margin s25;
    static const Margin s28;
    static const Margin s32;
    static const Margin s40;
    static const Margin s50;
    static const Margin s75;
    static const Margin s100;
    static const Margin min;
    static const Margin max;
};

/** Integer padding, shrinks a rectangle inward when applied. */
struct Padding {
    int8_t left = 0;
    int8_t top = 0;
    int8_t right = 0;
    int8_t bottom = 0;

    static constexpr Padding same(const int8_t all)
    {
        return { all, all, all, all };
    }

    static constexpr Padding symmetric(const int8_t x, const int8_t y)
    {
        return { x, y, x, y };
    }

    inline int16_t x() const { return int16_t(left) + int16_t(right); }
    inline int16_t y() const { return int16_t(top) + int16_t(bottom); }

    inline float leftf() const { return left; }
    inline float topf() const { return top; }
    inline float rightf() const { return right; }
    inline float bottomf() const { return bottom; }

    Padding operator+(const Padding& rhs) const;
    Padding operator-(const Padding& rhs) const;

    bool operator==(const Padding&) const = default;

    Padding lerp(const Padding& other, const float t) const;
    Padding clamped_lerp(const Padding& other, const float t) const;

    Paddingf to_paddingf() const;

    Margin to_margin() const;
    static Padding from_margin(const Margin& margin);

    static const Padding zero;
    static const Padding neg_one;
    static const Padding s1;
    static const Padding s2;
    static const Padding s3;
    static const Padding s4;
    static const Padding s5;
    static const Padding s6;
    static const Padding s8;
    static const Padding s10;
    static const Padding s15;
    static const Padding s16;
    static const Padding s18;
    static const Padding s20;
    static const Padding s22;
    static const Padding s24;
    static const Padding s25;
    static const Padding s28;
    static const Padding s32;
    static const Padding s40;
    static const Padding s50;
    static const Padding s75;
    static const Padding s100;
    static const Padding min;
    static const Padding max;
};

/** Float margin. */
struct Marginf {
    float left = 0;
    float top = 0;
    float right = 0;
    float bottom = 0;

    static constexpr Marginf same(const float all)
    {
        return { all, all, all, all };
    }

    static constexpr Marginf symmetric(const float x, const float y)
    {
        return { x, y, x, y };
    }

    inline float x() const { return left + right; }
    inline float y() const { return top + bottom; }

    Marginf operator+(const Marginf& rhs) const;
    Marginf operator-(const Marginf& rhs) const;

    bool operator==(const Marginf&) const = default;

    Marginf lerp(const Marginf& other, const float t) const;
    Marginf clamped_lerp(const Marginf& other, const float t) const;

    Paddingf to_padding() const;
    static Marginf from_padding(const Paddingf& padding);
};

/** Float padding. */
struct Paddingf {
    float left = 0;
    float top = 0;
    float right = 0;
    float bottom = 0;

    static constexpr Paddingf same(const float all)
    {
        return { all, all, all, all };
    }

    static constexpr Paddingf symmetric(const float x, const float y)
    {
        return { x, y, x, y };
    }

    inline float x() const { return left + right; }
    inline float y() const { return top + bottom; }

    Paddingf operator+(const Paddingf& rhs) const;
    Paddingf operator-(const Paddingf& rhs) const;

    bool operator==(const Paddingf&) const = default;

    Paddingf lerp(const Paddingf& other, const float t) const;
    Paddingf clamped_lerp(const Paddingf& other, const float t) const;

    Marginf to_margin() const;
    static Paddingf from_margin(const Marginf& margin);
};
