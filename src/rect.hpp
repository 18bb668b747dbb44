// SPDX-License-Identifier: MIT
// Axis-aligned rectangle.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include "anchor.hpp"
#include "check.hpp"
#include "direction.hpp"
#include "inset.hpp"
#include "pos.hpp"
#include "size.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

/**
 * Four cells of a 2x2 subdivision.
 * Cells are stored as left-top, right-top, left-bottom, right-bottom, so
 * that the cell at (col, row) has index col | row << 1.
 */
template <typename T> struct Quadrants {
    std::array<T, 4> cells;

    inline T& left_top() { return cells[0]; }
    inline const T& left_top() const { return cells[0]; }
    inline T& right_top() { return cells[1]; }
    inline const T& right_top() const { return cells[1]; }
    inline T& left_bottom() { return cells[2]; }
    inline const T& left_bottom() const { return cells[2]; }
    inline T& right_bottom() { return cells[3]; }
    inline const T& right_bottom() const { return cells[3]; }

    /**
     * Get cell by its grid coordinates.
     * @param col column index, 0 or 1
     * @param row row index, 0 or 1
     * @return cell reference
     */
    inline T& operator()(const uint32_t col, const uint32_t row)
    {
        RECTKIT_CHECK((col | row) <= 1, "quadrant index out of range");
        return cells[col | (row << 1)];
    }

    inline const T& operator()(const uint32_t col, const uint32_t row) const
    {
        RECTKIT_CHECK((col | row) <= 1, "quadrant index out of range");
        return cells[col | (row << 1)];
    }

    inline typename std::array<T, 4>::iterator begin() { return cells.begin(); }
    inline typename std::array<T, 4>::iterator end() { return cells.end(); }
    inline typename std::array<T, 4>::const_iterator begin() const
    {
        return cells.begin();
    }
    inline typename std::array<T, 4>::const_iterator end() const
    {
        return cells.end();
    }
};

/**
 * Rectangle defined by its left-top (min) and right-bottom (max) corners.
 * A well-formed rectangle has min.x <= max.x and min.y <= max.y; empty
 * (zero width or height) rectangles are allowed.
 */
struct Rect {
    Pos min;
    Pos max;

    Rect() = default;

    /**
     * Constructor.
     * @param x,y left-top coordinates of rectangle
     * @param width,height rectangle size, must not be negative
     */
    Rect(const float x, const float y, const float width, const float height);

    /**
     * Create rectangle from its corners.
     * @param min left-top corner
     * @param max right-bottom corner, must not be less than min
     */
    static Rect from_min_max(const Pos& min, const Pos& max);

    static Rect from_min_size(const Pos& min, const Size& size);
    static Rect square_from_min_size(const Pos& min, const float side_length);

    /**
     * Create rectangle around the center point.
     * @param center center of the rectangle
     * @param size rectangle size
     */
    static Rect centered(const Pos& center, const Size& size);
    static Rect centered_square(const Pos& center, const float side_length);

    /**
     * Create rectangle with the anchor placed at the pivot point.
     * @param anchor anchor of the new rectangle
     * @param pivot anchor position
     * @param size rectangle size
     */
    static Rect from_anchored_pivot(const Anchor anchor, const Pos& pivot,
                                    const Size& size);

    /**
     * Create rectangle spanning two arbitrary points.
     */
    static Rect from_points(const Pos& a, const Pos& b);

    /**
     * Get smallest rectangle that covers all rectangles.
     * @param rects rectangles to cover
     * @return bounding rectangle, zero rectangle if the list is empty
     */
    static Rect min_rect(const std::span<const Rect> rects);

    /**
     * Get common area of all rectangles.
     * @param rects rectangles to intersect
     * @return intersection, nothing if the list is empty or any pair of
     *         rectangles does not overlap
     */
    static std::optional<Rect> intersect_all(const std::span<const Rect> rects);

    /** Swap min and max coordinates where they are inverted. */
    void fix();
    Rect fixed() const;

    // Size

    inline Size size() const { return { width(), height() }; }

    /** Resize keeping the left-top corner. */
    void set_size(const Size& size);
    Rect with_size(const Size& size) const;
    /** Resize keeping the center. */
    void set_size_centered(const Size& size);
    Rect with_size_centered(const Size& size) const;
    /** Resize keeping the anchor position. */
    void set_size_anchored(const Size& size, const Anchor anchor);
    Rect with_size_anchored(const Size& size, const Anchor anchor) const;

    inline float width() const { return max.x - min.x; }
    void set_width(const float width);
    Rect with_width(const float width) const;
    void set_width_centered(const float width);
    Rect with_width_centered(const float width) const;
    void set_width_right(const float width);
    Rect with_width_right(const float width) const;

    inline float height() const { return max.y - min.y; }
    void set_height(const float height);
    Rect with_height(const float height) const;
    void set_height_centered(const float height);
    Rect with_height_centered(const float height) const;
    void set_height_bottom(const float height);
    Rect with_height_bottom(const float height) const;

    /**
     * Get aspect ratio.
     * @return width divided by height
     */
    inline float aspect_ratio() const { return width() / height(); }

    inline float hypotenuse_squared() const
    {
        return min.distance_squared(max);
    }
    float hypotenuse() const;

    // Edges: set_* moves the rectangle, set_*_bound moves the edge only

    inline float left() const { return min.x; }
    void set_left(const float left);
    Rect with_left(const float left) const;
    void set_left_bound(const float left);
    Rect with_left_bound(const float left) const;

    inline float right() const { return max.x; }
    void set_right(const float right);
    Rect with_right(const float right) const;
    void set_right_bound(const float right);
    Rect with_right_bound(const float right) const;

    inline float top() const { return min.y; }
    void set_top(const float top);
    Rect with_top(const float top) const;
    void set_top_bound(const float top);
    Rect with_top_bound(const float top) const;

    inline float bottom() const { return max.y; }
    void set_bottom(const float bottom);
    Rect with_bottom(const float bottom) const;
    void set_bottom_bound(const float bottom);
    Rect with_bottom_bound(const float bottom) const;

    // Anchors: set_* moves the rectangle, set_*_bound moves the corner only

    inline Pos left_top() const { return min; }
    void set_left_top(const Pos& pos);
    Rect with_left_top(const Pos& pos) const;
    void set_left_top_bound(const Pos& pos);
    Rect with_left_top_bound(const Pos& pos) const;

    inline Pos right_top() const { return { max.x, min.y }; }
    void set_right_top(const Pos& pos);
    Rect with_right_top(const Pos& pos) const;
    void set_right_top_bound(const Pos& pos);
    Rect with_right_top_bound(const Pos& pos) const;

    inline Pos left_bottom() const { return { min.x, max.y }; }
    void set_left_bottom(const Pos& pos);
    Rect with_left_bottom(const Pos& pos) const;
    void set_left_bottom_bound(const Pos& pos);
    Rect with_left_bottom_bound(const Pos& pos) const;

    inline Pos right_bottom() const { return max; }
    void set_right_bottom(const Pos& pos);
    Rect with_right_bottom(const Pos& pos) const;
    void set_right_bottom_bound(const Pos& pos);
    Rect with_right_bottom_bound(const Pos& pos) const;

    Pos left_center() const;
    void set_left_center(const Pos& pos);
    Rect with_left_center(const Pos& pos) const;

    Pos top_center() const;
    void set_top_center(const Pos& pos);
    Rect with_top_center(const Pos& pos) const;

    Pos right_center() const;
    void set_right_center(const Pos& pos);
    Rect with_right_center(const Pos& pos) const;

    Pos bottom_center() const;
    void set_bottom_center(const Pos& pos);
    Rect with_bottom_center(const Pos& pos) const;

    Pos center() const;
    void set_center(const Pos& pos);
    Rect with_center(const Pos& pos) const;

    /**
     * Get anchor position.
     * @param anchor anchor to query
     * @return anchor coordinates
     */
    Pos anchor(const Anchor anchor) const;

    /**
     * Move rectangle so that the anchor is at the specified position.
     * @param anchor anchor to place
     * @param pos new anchor position
     */
    void place_anchor(const Anchor anchor, const Pos& pos);

    /**
     * Move edges adjacent to the anchor to the specified position,
     * the opposite edges stay in place. Center moves the whole rectangle.
     * @param anchor anchor to place
     * @param pos new anchor position
     */
    void place_anchor_bound(const Anchor anchor, const Pos& pos);
    Rect with_placed_anchor(const Anchor anchor, const Pos& pos) const;

    /**
     * Flip rectangle over the anchor: the opposite anchor takes the
     * current position of the anchor. Center is a fixed point.
     * @param anchor anchor to flip over
     */
    void move_to_anchor(const Anchor anchor);
    Rect moved_to_anchor(const Anchor anchor) const;

    /**
     * Move by a number of own widths and heights.
     * @param cols,rows offset in cells
     */
    void move_on_grid(const int cols, const int rows);
    Rect moved_on_grid(const int cols, const int rows) const;

    /**
     * Get position by normalized coordinates.
     * @param uv (0, 0) for left-top, (1, 1) for right-bottom
     * @return absolute position
     */
    Pos uv_pos(const Pos& uv) const;

    /**
     * Move rectangle so that the point at uv coordinates is at pos.
     */
    void set_uv_pos(const Pos& uv, const Pos& pos);
    Rect with_uv_pos(const Pos& uv, const Pos& pos) const;

    /**
     * Move rectangle so that its offset from pos equals its current
     * offset from pivot.
     */
    void set_relative_position(const Pos& pivot, const Pos& pos);

    // Relations

    /**
     * Check if point is inside the rectangle.
     * Right and bottom edges are excluded.
     * @param pos point to check
     */
    bool contains(const Pos& pos) const;

    /** Check if the other rectangle lies completely within this one. */
    bool contains_rect(const Rect& rect) const;
    /** Check if this rectangle lies completely within the other one. */
    bool inside_rect(const Rect& rect) const;
    bool outside_rect(const Rect& rect) const;

    /**
     * Check if rectangles share some area.
     * Rectangles that only touch each other do not intersect.
     */
    bool intersects(const Rect& rect) const;

    /**
     * Get intersection of two rectangles.
     * @param other rectangle for intersection calculation
     * @return common area or nothing if rectangles do not intersect
     */
    std::optional<Rect> intersection(const Rect& other) const;

    /** Grow to cover the other rectangle. */
    void extend_to_fit(const Rect& rect);
    Rect extended_to_fit(const Rect& rect) const;
    Rect combine(const Rect& rect) const;

    // Translation and resizing

    void translate(const Pos& offset);
    Rect with_translation(const Pos& offset) const;
    void inv_translate(const Pos& offset);
    Rect with_inv_translation(const Pos& offset) const;
    Rect add_offset(const Pos& offset) const;
    Rect sub_offset(const Pos& offset) const;

    /** Grow right and bottom edges. */
    Rect add_size(const Size& size) const;
    /** Grow every edge by the size. */
    Rect add_size_centered(const Size& size) const;
    Rect sub_size(const Size& size) const;
    Rect sub_size_centered(const Size& size) const;

    Rect inflate(const float expand) const;
    Rect inflate(const float x, const float y) const;
    Rect deflate(const float shrink) const;
    Rect deflate(const float x, const float y) const;

    void set_scale(const float scalar);
    Rect with_scale(const float scalar) const;
    void set_scale_centered(const float scalar);
    Rect with_scale_centered(const float scalar) const;
    void set_scale_anchored(const float scalar, const Anchor anchor);
    Rect with_scale_anchored(const float scalar, const Anchor anchor) const;

    /** Swap width and height keeping the left-top corner. */
    void swap_lengths();
    Rect swapped_lengths() const;
    void centered_swap_lengths();
    Rect centered_swapped_lengths() const;
    void anchored_swap_lengths(const Anchor anchor);
    Rect anchored_swapped_lengths(const Anchor anchor) const;

    // Insets: padding shrinks the rectangle, margin grows it

    Rect add_padding(const Paddingf& padding) const;
    Rect add_padding(const Padding& padding) const;
    Rect sub_padding(const Paddingf& padding) const;
    Rect sub_padding(const Padding& padding) const;
    void apply_padding(const Paddingf& padding);
    void apply_padding(const Padding& padding);
    void remove_padding(const Paddingf& padding);
    void remove_padding(const Padding& padding);

    /**
     * Grow by the margin keeping the left-top corner.
     * @param margin total horizontal and vertical margins are used
     */
    Rect add_margin(const Marginf& margin) const;
    Rect add_margin(const Margin& margin) const;

    /**
     * Grow every side by its margin.
     */
    Rect add_margin_centered(const Marginf& margin) const;
    Rect add_margin_centered(const Margin& margin) const;

    /**
     * Grow by the margin keeping the anchor position.
     */
    Rect add_margin_anchored(const Marginf& margin, const Anchor anchor) const;
    Rect add_margin_anchored(const Margin& margin, const Anchor anchor) const;

    Rect sub_margin(const Marginf& margin) const;
    Rect sub_margin(const Margin& margin) const;
    Rect sub_margin_centered(const Marginf& margin) const;
    Rect sub_margin_centered(const Margin& margin) const;
    Rect sub_margin_anchored(const Marginf& margin, const Anchor anchor) const;
    Rect sub_margin_anchored(const Margin& margin, const Anchor anchor) const;
    void apply_margin(const Marginf& margin);
    void apply_margin(const Margin& margin);
    void remove_margin(const Marginf& margin);
    void remove_margin(const Margin& margin);

    // Partitioning

    /**
     * Cut strip from the left edge.
     * @param length strip width
     * @return pair of (left, right) parts
     */
    std::pair<Rect, Rect> split_from_left(const float length) const;

    /**
     * Cut strip from the top edge.
     * @param length strip height
     * @return pair of (top, bottom) parts
     */
    std::pair<Rect, Rect> split_from_top(const float length) const;

    /**
     * Cut strip from the right edge.
     * @param length strip width
     * @return pair of (right, left) parts
     */
    std::pair<Rect, Rect> split_from_right(const float length) const;

    /**
     * Cut strip from the bottom edge.
     * @param length strip height
     * @return pair of (bottom, top) parts
     */
    std::pair<Rect, Rect> split_from_bottom(const float length) const;

    /** Split at the middle into (left, right). */
    std::pair<Rect, Rect> split_horizontal() const;
    /** Split at the middle into (top, bottom). */
    std::pair<Rect, Rect> split_vertical() const;

    Quadrants<Rect> into_quadrants() const;

    // Strips and corner boxes touching the rectangle from outside
    Rect left_adjacent(const float length) const;
    Rect top_adjacent(const float length) const;
    Rect right_adjacent(const float length) const;
    Rect bottom_adjacent(const float length) const;
    Rect left_top_adjacent(const Size& size) const;
    Rect right_top_adjacent(const Size& size) const;
    Rect left_bottom_adjacent(const Size& size) const;
    Rect right_bottom_adjacent(const Size& size) const;

    /**
     * Get handle area for the anchor.
     * Corner anchors give a box at the corner, edge anchors give a strip
     * along the edge between the corner boxes, Center gives the area
     * between all strips.
     * @param anchor handle anchor
     * @param placement handle position relative to the boundary
     * @param thickness horizontal and vertical handle thickness
     * @return handle rectangle
     */
    Rect anchor_rect(const Anchor anchor, const Placement placement,
                     const Size& thickness) const;

    /**
     * Get handle area with equal thickness on both axes.
     * @see anchor_rect
     */
    Rect handle_rect(const Anchor anchor, const Placement placement,
                     const float size) const;

    /** Get rectangle of the size centered on the anchor. */
    Rect pivot_rect(const Anchor anchor, const Size& size) const;
    Rect square_pivot_rect(const Anchor anchor, const float side_length) const;

    /**
     * Find cell of a cols x rows grid that contains the point.
     * @param pos point to look up
     * @param cols,rows grid dimensions
     * @return cell rectangle, nothing if the point is outside or the grid
     *         is empty
     */
    std::optional<Rect> subdivision_containing(const Pos& pos,
                                               const uint32_t cols,
                                               const uint32_t rows) const;

    /**
     * Find cell of a cols x rows grid that contains the whole rectangle.
     * @return cell rectangle, this rectangle if no single cell covers it,
     *         nothing if the rectangle is outside or the grid is empty
     */
    std::optional<Rect> subdivision_containing_rect(const Rect& rect,
                                                    const uint32_t cols,
                                                    const uint32_t rows) const;

    // Fitting

    /**
     * Scale size to fit inside, centered.
     * @param size size to scale, aspect ratio is preserved
     */
    Rect scale_inside(const Size& size) const;

    /**
     * Scale size to cover the whole area, centered.
     */
    Rect scale_outside(const Size& size) const;

    /**
     * Scale size so that its smaller side matches the smaller side of
     * this rectangle, centered.
     */
    Rect scale_middle(const Size& size) const;

    Rect lerp(const Rect& other, const float t) const;
    Rect clamped_lerp(const Rect& other, const float t) const;

    // Distance

    /**
     * Get signed distance from the point to the boundary.
     * @param pos point to measure
     * @return negative inside, positive outside
     */
    float sdf(const Pos& pos) const;

    /**
     * Get nearest point on the boundary.
     * Points outside are clamped to the rectangle, points inside are
     * moved to the nearest edge.
     * @param pos point to project
     */
    Pos closest_point(const Pos& pos) const;

    // Corners and edges

    /** @return left-top, right-top, left-bottom, right-bottom */
    std::array<Pos, 4> corners() const;
    std::array<Pos, 4> corners_cw() const;
    std::array<Pos, 4> corners_ccw() const;

    Pos edge_midpoint(const Axial edge) const;
    std::array<Pos, 2> edge_points_cw(const Axial edge) const;
    std::array<Pos, 2> edge_points_ccw(const Axial edge) const;
    std::array<Pos, 2> edge_points_min_max(const Axial edge) const;
    std::array<Pos, 2> edge_points_max_min(const Axial edge) const;

    // Rounding, ceil_floor may invert a rectangle narrower than one unit

    Rect floor() const;
    Rect ceil() const;
    Rect floor_ceil() const;
    Rect ceil_floor() const;
    Rect round() const;

    // Operators

    bool operator==(const Rect&) const = default;

    inline Rect operator+(const Margin& rhs) const
    {
        return add_margin_centered(rhs);
    }
    inline Rect operator-(const Margin& rhs) const
    {
        return sub_margin_centered(rhs);
    }
    inline Rect operator+(const Marginf& rhs) const
    {
        return add_margin_centered(rhs);
    }
    inline Rect operator-(const Marginf& rhs) const
    {
        return sub_margin_centered(rhs);
    }
    inline Rect operator+(const Padding& rhs) const
    {
        return add_padding(rhs);
    }
    inline Rect operator-(const Padding& rhs) const
    {
        return sub_padding(rhs);
    }
    inline Rect operator+(const Paddingf& rhs) const
    {
        return add_padding(rhs);
    }
    inline Rect operator-(const Paddingf& rhs) const
    {
        return sub_padding(rhs);
    }
    inline Rect operator+(const Pos& rhs) const { return add_offset(rhs); }
    inline Rect operator-(const Pos& rhs) const { return sub_offset(rhs); }

    inline Rect& operator+=(const Pos& rhs)
    {
        translate(rhs);
        return *this;
    }
    inline Rect& operator-=(const Pos& rhs)
    {
        inv_translate(rhs);
        return *this;
    }

    /** Grow right and bottom edges. */
    inline Rect& operator+=(const Size& rhs)
    {
        max = max.add_dims(rhs.width, rhs.height);
        return *this;
    }
    inline Rect& operator-=(const Size& rhs)
    {
        max = max.sub_dims(rhs.width, rhs.height);
        return *this;
    }

    inline std::optional<Rect> operator&(const Rect& rhs) const
    {
        return intersection(rhs);
    }

    static const Rect zero;
    static const Rect unit;
};

inline std::optional<Rect> operator&(const std::optional<Rect>& lhs,
                                     const Rect& rhs)
{
    if (!lhs) {
        return std::nullopt;
    }
    return lhs->intersection(rhs);
}

inline std::optional<Rect> operator&(const Rect& lhs,
                                     const std::optional<Rect>& rhs)
{
    if (!rhs) {
        return std::nullopt;
    }
    return lhs.intersection(*rhs);
}
