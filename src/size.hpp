// SPDX-License-Identifier: MIT
// Object size.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include "check.hpp"
#include "inset.hpp"

#include <array>
#include <cstddef>
#include <cmath>
#include <utility>

/** Width and height of an object. */
struct Size {
    float width = 0;
    float height = 0;

    /**
     * Create square size.
     * @param side_length width and height
     */
    static inline Size square(const float side_length)
    {
        return { side_length, side_length };
    }

    static inline Size from_array(const std::array<float, 2>& arr)
    {
        return { arr[0], arr[1] };
    }

    static inline Size from_pair(const std::pair<float, float>& pair)
    {
        return { pair.first, pair.second };
    }

    inline std::array<float, 2> to_array() const { return { width, height }; }

    inline std::pair<float, float> to_pair() const
    {
        return { width, height };
    }

    /**
     * Get area.
     * @return width multiplied by height
     */
    inline float area() const { return width * height; }

    inline Size half() const { return { width * 0.5f, height * 0.5f }; }
    inline float half_width() const { return width * 0.5f; }
    inline float half_height() const { return height * 0.5f; }

    /**
     * Get aspect ratio.
     * @return width divided by height, inf or NaN if height is zero
     */
    inline float aspect_ratio() const { return width / height; }

    /**
     * Check if both dimensions are non-negative.
     * @return true if size can be used to build a well-formed rectangle
     */
    inline bool is_positive() const { return width >= 0 && height >= 0; }

    /**
     * Check if both sides are exactly equal.
     */
    inline bool is_square() const { return width == height; }

    /**
     * Check if sides differ by no more than specified error.
     * @param error allowed difference between sides
     */
    inline bool is_square_fuzzy(const float error) const
    {
        return std::fmax(width, height) - std::fmin(width, height) <= error;
    }

    inline bool is_horizontal() const { return width > height; }
    inline bool is_vertical() const { return height > width; }

    inline float min_dim() const { return std::fmin(width, height); }
    inline float max_dim() const { return std::fmax(width, height); }

    /**
     * Get largest square that fits into this size.
     */
    inline Size inner_square() const { return square(min_dim()); }

    /**
     * Swap width and height.
     */
    inline Size swap_dims() const { return { height, width }; }

    inline Size negate() const { return { -width, -height }; }

    inline Size scale(const float scalar) const
    {
        return { width * scalar, height * scalar };
    }

    inline Size add_dims(const float w, const float h) const
    {
        return { width + w, height + h };
    }

    inline Size sub_dims(const float w, const float h) const
    {
        return { width - w, height - h };
    }

    inline Size mul_dims(const float w, const float h) const
    {
        return { width * w, height * h };
    }

    inline Size div_dims(const float w, const float h) const
    {
        return { width / w, height / h };
    }

    inline Size rem_dims(const float w, const float h) const
    {
        return { std::fmod(width, w), std::fmod(height, h) };
    }

    /**
     * Grow by total horizontal and vertical margin.
     */
    inline Size add_margin(const Marginf& margin) const
    {
        return add_dims(margin.x(), margin.y());
    }

    inline Size add_margin(const Margin& margin) const
    {
        return add_dims(margin.x(), margin.y());
    }

    /**
     * Shrink by total horizontal and vertical margin.
     */
    inline Size sub_margin(const Marginf& margin) const
    {
        return sub_dims(margin.x(), margin.y());
    }

    inline Size sub_margin(const Margin& margin) const
    {
        return sub_dims(margin.x(), margin.y());
    }

    inline float operator[](const size_t index) const
    {
        RECTKIT_CHECK(index < 2, "size index out of range");
        return index == 0 ? width : height;
    }

    inline Size operator-() const { return negate(); }

    inline Size operator+(const Size& rhs) const
    {
        return add_dims(rhs.width, rhs.height);
    }
    inline Size operator+(const float rhs) const { return add_dims(rhs, rhs); }
    inline Size operator+(const std::pair<float, float>& rhs) const
    {
        return add_dims(rhs.first, rhs.second);
    }
    inline Size operator+(const std::array<float, 2>& rhs) const
    {
        return add_dims(rhs[0], rhs[1]);
    }

    inline Size operator-(const Size& rhs) const
    {
        return sub_dims(rhs.width, rhs.height);
    }
    inline Size operator-(const float rhs) const { return sub_dims(rhs, rhs); }
    inline Size operator-(const std::pair<float, float>& rhs) const
    {
        return sub_dims(rhs.first, rhs.second);
    }
    inline Size operator-(const std::array<float, 2>& rhs) const
    {
        return sub_dims(rhs[0], rhs[1]);
    }

    inline Size operator*(const Size& rhs) const
    {
        return mul_dims(rhs.width, rhs.height);
    }
    inline Size operator*(const float rhs) const { return mul_dims(rhs, rhs); }
    inline Size operator*(const std::pair<float, float>& rhs) const
    {
        return mul_dims(rhs.first, rhs.second);
    }
    inline Size operator*(const std::array<float, 2>& rhs) const
    {
        return mul_dims(rhs[0], rhs[1]);
    }

    inline Size operator/(const Size& rhs) const
    {
        return div_dims(rhs.width, rhs.height);
    }
    inline Size operator/(const float rhs) const { return div_dims(rhs, rhs); }
    inline Size operator/(const std::pair<float, float>& rhs) const
    {
        return div_dims(rhs.first, rhs.second);
    }
    inline Size operator/(const std::array<float, 2>& rhs) const
    {
        return div_dims(rhs[0], rhs[1]);
    }

    inline Size operator%(const Size& rhs) const
    {
        return rem_dims(rhs.width, rhs.height);
    }
    inline Size operator%(const float rhs) const { return rem_dims(rhs, rhs); }
    inline Size operator%(const std::pair<float, float>& rhs) const
    {
        return rem_dims(rhs.first, rhs.second);
    }
    inline Size operator%(const std::array<float, 2>& rhs) const
    {
        return rem_dims(rhs[0], rhs[1]);
    }

    bool operator==(const Size&) const = default;

    // Common sizes
    static const Size zero;
    static const Size one;
    static const Size vga;
    static const Size hd;
    static const Size fhd;
    static const Size qhd;
    static const Size uhd_4k;
    static const Size uhd_8k;
};

/** Ratio of width to height. */
struct AspectRatio {
    float ratio = 1;

    /**
     * Create aspect ratio from dimensions.
     * @param width,height object dimensions
     */
    static inline AspectRatio from_dims(const float width, const float height)
    {
        return { width / height };
    }

    static inline AspectRatio from_size(const Size& size)
    {
        return { size.aspect_ratio() };
    }

    /**
     * Get width for the given height.
     */
    inline float width_from_height(const float height) const
    {
        return height * ratio;
    }

    /**
     * Get height for the given width.
     */
    inline float height_from_width(const float width) const
    {
        return width / ratio;
    }
};
