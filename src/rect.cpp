// SPDX-License-Identifier: MIT
// Axis-aligned rectangle.
// Copyright (C) 2026 rectkit contributors

#include "rect.hpp"

#include "scalar.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

const Rect Rect::zero = {};
const Rect Rect::unit = { 0, 0, 1, 1 };

/**
 * Create rectangle without checking its corners.
 * @param min,max rectangle corners
 */
static Rect make_rect(const Pos& min, const Pos& max)
{
    Rect rect;
    rect.min = min;
    rect.max = max;
    return rect;
}

Rect::Rect(const float x, const float y, const float width, const float height)
    : min { x, y }
    , max { x + width, y + height }
{
    RECTKIT_CHECK((Size { width, height }.is_positive()),
                  "rectangle size is negative");
}

Rect Rect::from_min_max(const Pos& min, const Pos& max)
{
    RECTKIT_CHECK(min.le(max), "rectangle min is greater than max");
    return make_rect(min, max);
}

Rect Rect::from_min_size(const Pos& min, const Size& size)
{
    RECTKIT_CHECK(size.is_positive(), "rectangle size is negative");
    return from_min_max(min, min + size);
}

Rect Rect::square_from_min_size(const Pos& min, const float side_length)
{
    RECTKIT_CHECK(is_positive(side_length), "rectangle side is negative");
    return from_min_max(min, min + side_length);
}

Rect Rect::centered(const Pos& center, const Size& size)
{
    RECTKIT_CHECK(size.is_positive(), "rectangle size is negative");
    const Size half_size = size.half();
    return from_min_max(center - half_size, center + half_size);
}

Rect Rect::centered_square(const Pos& center, const float side_length)
{
    RECTKIT_CHECK(is_positive(side_length), "rectangle side is negative");
    const float half_side = half(side_length);
    return from_min_max(center - half_side, center + half_side);
}

Rect Rect::from_anchored_pivot(const Anchor anchor, const Pos& pivot,
                               const Size& size)
{
    switch (anchor) {
        case Anchor::LeftTop:
            return from_min_size(pivot, size);
        case Anchor::LeftCenter:
            return from_min_size({ pivot.x, pivot.y - size.half_height() },
                                 size);
        case Anchor::LeftBottom:
            return from_min_size({ pivot.x, pivot.y - size.height }, size);
        case Anchor::BottomCenter:
            return from_min_size(
                { pivot.x - size.half_width(), pivot.y - size.height }, size);
        case Anchor::RightBottom:
            return from_min_size(pivot - size, size);
        case Anchor::RightCenter:
            return from_min_size(
                { pivot.x - size.width, pivot.y - size.half_height() }, size);
        case Anchor::RightTop:
            return from_min_size({ pivot.x - size.width, pivot.y }, size);
        case Anchor::TopCenter:
            return from_min_size({ pivot.x - size.half_width(), pivot.y },
                                 size);
        case Anchor::Center:
            return from_min_size(pivot - size.half(), size);
    }
    return from_min_size(pivot, size);
}

Rect Rect::from_points(const Pos& a, const Pos& b)
{
    return make_rect(a.min(b), a.max(b));
}

Rect Rect::min_rect(const std::span<const Rect> rects)
{
    if (rects.empty()) {
        return zero;
    }
    Rect bounds = rects.front();
    for (const Rect& rect : rects.subspan(1)) {
        bounds.extend_to_fit(rect);
    }
    return bounds;
}

std::optional<Rect> Rect::intersect_all(const std::span<const Rect> rects)
{
    if (rects.empty()) {
        return std::nullopt;
    }
    std::optional<Rect> common = rects.front();
    for (const Rect& rect : rects.subspan(1)) {
        common = common & rect;
        if (!common) {
            break;
        }
    }
    return common;
}

void Rect::fix()
{
    const Pos lo = min.min(max);
    const Pos hi = min.max(max);
    min = lo;
    max = hi;
}

Rect Rect::fixed() const
{
    Rect rect = *this;
    rect.fix();
    return rect;
}

void Rect::set_size(const Size& size)
{
    max = min + size;
}

Rect Rect::with_size(const Size& size) const
{
    return from_min_size(min, size);
}

void Rect::set_size_centered(const Size& size)
{
    *this = with_size_centered(size);
}

Rect Rect::with_size_centered(const Size& size) const
{
    return centered(center(), size);
}

void Rect::set_size_anchored(const Size& size, const Anchor anchor)
{
    *this = with_size_anchored(size, anchor);
}

Rect Rect::with_size_anchored(const Size& size, const Anchor anchor) const
{
    return from_anchored_pivot(anchor, this->anchor(anchor), size);
}

void Rect::set_width(const float width)
{
    max.x = min.x + width;
}

Rect Rect::with_width(const float width) const
{
    Rect rect = *this;
    rect.set_width(width);
    return rect;
}

void Rect::set_width_centered(const float width)
{
    const float mid_x = std::midpoint(min.x, max.x);
    min.x = mid_x - half(width);
    max.x = mid_x + half(width);
}

Rect Rect::with_width_centered(const float width) const
{
    Rect rect = *this;
    rect.set_width_centered(width);
    return rect;
}

void Rect::set_width_right(const float width)
{
    min.x = max.x - width;
}

Rect Rect::with_width_right(const float width) const
{
    Rect rect = *this;
    rect.set_width_right(width);
    return rect;
}

void Rect::set_height(const float height)
{
    max.y = min.y + height;
}

Rect Rect::with_height(const float height) const
{
    Rect rect = *this;
    rect.set_height(height);
    return rect;
}

void Rect::set_height_centered(const float height)
{
    const float mid_y = std::midpoint(min.y, max.y);
    min.y = mid_y - half(height);
    max.y = mid_y + half(height);
}

Rect Rect::with_height_centered(const float height) const
{
    Rect rect = *this;
    rect.set_height_centered(height);
    return rect;
}

void Rect::set_height_bottom(const float height)
{
    min.y = max.y - height;
}

Rect Rect::with_height_bottom(const float height) const
{
    Rect rect = *this;
    rect.set_height_bottom(height);
    return rect;
}

float Rect::hypotenuse() const
{
    return min.distance(max);
}

void Rect::set_left(const float left)
{
    const float cur_width = width();
    min.x = left;
    max.x = left + cur_width;
}

Rect Rect::with_left(const float left) const
{
    Rect rect = *this;
    rect.set_left(left);
    return rect;
}

void Rect::set_left_bound(const float left)
{
    min.x = left;
}

Rect Rect::with_left_bound(const float left) const
{
    Rect rect = *this;
    rect.set_left_bound(left);
    return rect;
}

void Rect::set_right(const float right)
{
    const float cur_width = width();
    min.x = right - cur_width;
    max.x = right;
}

Rect Rect::with_right(const float right) const
{
    Rect rect = *this;
    rect.set_right(right);
    return rect;
}

void Rect::set_right_bound(const float right)
{
    max.x = right;
}

Rect Rect::with_right_bound(const float right) const
{
    Rect rect = *this;
    rect.set_right_bound(right);
    return rect;
}

void Rect::set_top(const float top)
{
    const float cur_height = height();
    min.y = top;
    max.y = top + cur_height;
}

Rect Rect::with_top(const float top) const
{
    Rect rect = *this;
    rect.set_top(top);
    return rect;
}

void Rect::set_top_bound(const float top)
{
    min.y = top;
}

Rect Rect::with_top_bound(const float top) const
{
    Rect rect = *this;
    rect.set_top_bound(top);
    return rect;
}

void Rect::set_bottom(const float bottom)
{
    const float cur_height = height();
    min.y = bottom - cur_height;
    max.y = bottom;
}

Rect Rect::with_bottom(const float bottom) const
{
    Rect rect = *this;
    rect.set_bottom(bottom);
    return rect;
}

void Rect::set_bottom_bound(const float bottom)
{
    max.y = bottom;
}

Rect Rect::with_bottom_bound(const float bottom) const
{
    Rect rect = *this;
    rect.set_bottom_bound(bottom);
    return rect;
}

void Rect::set_left_top(const Pos& pos)
{
    const Size cur_size = size();
    min = pos;
    max = pos + cur_size;
}

Rect Rect::with_left_top(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_left_top(pos);
    return rect;
}

void Rect::set_left_top_bound(const Pos& pos)
{
    min = pos;
}

Rect Rect::with_left_top_bound(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_left_top_bound(pos);
    return rect;
}

void Rect::set_right_top(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x - cur_size.width, pos.y };
    max = { pos.x, pos.y + cur_size.height };
}

Rect Rect::with_right_top(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_right_top(pos);
    return rect;
}

void Rect::set_right_top_bound(const Pos& pos)
{
    max.x = pos.x;
    min.y = pos.y;
}

Rect Rect::with_right_top_bound(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_right_top_bound(pos);
    return rect;
}

void Rect::set_left_bottom(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x, pos.y - cur_size.height };
    max = { pos.x + cur_size.width, pos.y };
}

Rect Rect::with_left_bottom(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_left_bottom(pos);
    return rect;
}

void Rect::set_left_bottom_bound(const Pos& pos)
{
    min.x = pos.x;
    max.y = pos.y;
}

Rect Rect::with_left_bottom_bound(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_left_bottom_bound(pos);
    return rect;
}

void Rect::set_right_bottom(const Pos& pos)
{
    const Size cur_size = size();
    min = pos - cur_size;
    max = pos;
}

Rect Rect::with_right_bottom(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_right_bottom(pos);
    return rect;
}

void Rect::set_right_bottom_bound(const Pos& pos)
{
    max = pos;
}

Rect Rect::with_right_bottom_bound(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_right_bottom_bound(pos);
    return rect;
}

Pos Rect::left_center() const
{
    return { min.x, std::midpoint(min.y, max.y) };
}

void Rect::set_left_center(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x, pos.y - cur_size.half_height() };
    max = { pos.x + cur_size.width, pos.y + cur_size.half_height() };
}

Rect Rect::with_left_center(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_left_center(pos);
    return rect;
}

Pos Rect::top_center() const
{
    return { std::midpoint(min.x, max.x), min.y };
}

void Rect::set_top_center(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x - cur_size.half_width(), pos.y };
    max = { pos.x + cur_size.half_width(), pos.y + cur_size.height };
}

Rect Rect::with_top_center(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_top_center(pos);
    return rect;
}

Pos Rect::right_center() const
{
    return { max.x, std::midpoint(min.y, max.y) };
}

void Rect::set_right_center(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x - cur_size.width, pos.y - cur_size.half_height() };
    max = { pos.x, pos.y + cur_size.half_height() };
}

Rect Rect::with_right_center(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_right_center(pos);
    return rect;
}

Pos Rect::bottom_center() const
{
    return { std::midpoint(min.x, max.x), max.y };
}

void Rect::set_bottom_center(const Pos& pos)
{
    const Size cur_size = size();
    min = { pos.x - cur_size.half_width(), pos.y - cur_size.height };
    max = { pos.x + cur_size.half_width(), pos.y };
}

Rect Rect::with_bottom_center(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_bottom_center(pos);
    return rect;
}

Pos Rect::center() const
{
    return min.mid_point(max);
}

void Rect::set_center(const Pos& pos)
{
    const Size half_size = size().half();
    min = pos - half_size;
    max = pos + half_size;
}

Rect Rect::with_center(const Pos& pos) const
{
    Rect rect = *this;
    rect.set_center(pos);
    return rect;
}

Pos Rect::anchor(const Anchor anchor) const
{
    switch (anchor) {
        case Anchor::LeftTop:
            return left_top();
        case Anchor::LeftCenter:
            return left_center();
        case Anchor::LeftBottom:
            return left_bottom();
        case Anchor::BottomCenter:
            return bottom_center();
        case Anchor::RightBottom:
            return right_bottom();
        case Anchor::RightCenter:
            return right_center();
        case Anchor::RightTop:
            return right_top();
        case Anchor::TopCenter:
            return top_center();
        case Anchor::Center:
            return center();
    }
    return center();
}

void Rect::place_anchor(const Anchor anchor, const Pos& pos)
{
    switch (anchor) {
        case Anchor::LeftTop:
            set_left_top(pos);
            break;
        case Anchor::LeftCenter:
            set_left_center(pos);
            break;
        case Anchor::LeftBottom:
            set_left_bottom(pos);
            break;
        case Anchor::BottomCenter:
            set_bottom_center(pos);
            break;
        case Anchor::RightBottom:
            set_right_bottom(pos);
            break;
        case Anchor::RightCenter:
            set_right_center(pos);
            break;
        case Anchor::RightTop:
            set_right_top(pos);
            break;
        case Anchor::TopCenter:
            set_top_center(pos);
            break;
        case Anchor::Center:
            set_center(pos);
            break;
    }
}

void Rect::place_anchor_bound(const Anchor anchor, const Pos& pos)
{
    switch (anchor) {
        case Anchor::LeftTop:
            set_left_top_bound(pos);
            break;
        case Anchor::LeftCenter:
            set_left_bound(pos.x);
            break;
        case Anchor::LeftBottom:
            set_left_bottom_bound(pos);
            break;
        case Anchor::BottomCenter:
            set_bottom_bound(pos.y);
            break;
        case Anchor::RightBottom:
            set_right_bottom_bound(pos);
            break;
        case Anchor::RightCenter:
            set_right_bound(pos.x);
            break;
        case Anchor::RightTop:
            set_right_top_bound(pos);
            break;
        case Anchor::TopCenter:
            set_top_bound(pos.y);
            break;
        case Anchor::Center:
            set_center(pos);
            break;
    }
}

Rect Rect::with_placed_anchor(const Anchor anchor, const Pos& pos) const
{
    Rect rect = *this;
    rect.place_anchor(anchor, pos);
    return rect;
}

void Rect::move_to_anchor(const Anchor anchor)
{
    if (anchor == Anchor::Center) {
        return;
    }
    place_anchor(opposite(anchor), this->anchor(anchor));
}

Rect Rect::moved_to_anchor(const Anchor anchor) const
{
    Rect rect = *this;
    rect.move_to_anchor(anchor);
    return rect;
}

void Rect::move_on_grid(const int cols, const int rows)
{
    translate({ width() * static_cast<float>(cols),
                height() * static_cast<float>(rows) });
}

Rect Rect::moved_on_grid(const int cols, const int rows) const
{
    Rect rect = *this;
    rect.move_on_grid(cols, rows);
    return rect;
}

Pos Rect::uv_pos(const Pos& uv) const
{
    return { ::lerp(min.x, max.x, uv.x), ::lerp(min.y, max.y, uv.y) };
}

void Rect::set_uv_pos(const Pos& uv, const Pos& pos)
{
    translate(pos - uv_pos(uv));
}

Rect Rect::with_uv_pos(const Pos& uv, const Pos& pos) const
{
    Rect rect = *this;
    rect.set_uv_pos(uv, pos);
    return rect;
}

void Rect::set_relative_position(const Pos& pivot, const Pos& pos)
{
    const Pos min_offset = min - pivot;
    const Pos max_offset = max - pivot;
    min = pos + min_offset;
    max = pos + max_offset;
}

bool Rect::contains(const Pos& pos) const
{
    return min.x <= pos.x && min.y <= pos.y && max.x > pos.x &&
        max.y > pos.y;
}

bool Rect::contains_rect(const Rect& rect) const
{
    return min.x <= rect.min.x && max.x >= rect.max.x &&
        min.y <= rect.min.y && max.y >= rect.max.y;
}

bool Rect::inside_rect(const Rect& rect) const
{
    return rect.contains_rect(*this);
}

bool Rect::outside_rect(const Rect& rect) const
{
    return max.x < rect.min.x || max.y < rect.min.y || min.x >= rect.max.x ||
        min.y >= rect.max.y;
}

bool Rect::intersects(const Rect& rect) const
{
    return rect.min.x < max.x && rect.min.y < max.y && rect.max.x > min.x &&
        rect.max.y > min.y;
}

std::optional<Rect> Rect::intersection(const Rect& other) const
{
    if (!intersects(other)) {
        return std::nullopt;
    }
    return from_min_max(min.max(other.min), max.min(other.max));
}

void Rect::extend_to_fit(const Rect& rect)
{
    min = min.min(rect.min);
    max = max.max(rect.max);
}

Rect Rect::extended_to_fit(const Rect& rect) const
{
    Rect bounds = *this;
    bounds.extend_to_fit(rect);
    return bounds;
}

Rect Rect::combine(const Rect& rect) const
{
    return extended_to_fit(rect);
}

void Rect::translate(const Pos& offset)
{
    min += offset;
    max += offset;
}

Rect Rect::with_translation(const Pos& offset) const
{
    Rect rect = *this;
    rect.translate(offset);
    return rect;
}

void Rect::inv_translate(const Pos& offset)
{
    min -= offset;
    max -= offset;
}

Rect Rect::with_inv_translation(const Pos& offset) const
{
    Rect rect = *this;
    rect.inv_translate(offset);
    return rect;
}

Rect Rect::add_offset(const Pos& offset) const
{
    return from_min_max(min + offset, max + offset);
}

Rect Rect::sub_offset(const Pos& offset) const
{
    return from_min_max(min - offset, max - offset);
}

Rect Rect::add_size(const Size& size) const
{
    return from_min_max(min, max + size);
}

Rect Rect::add_size_centered(const Size& size) const
{
    return inflate(size.width, size.height);
}

Rect Rect::sub_size(const Size& size) const
{
    return from_min_max(min, max - size);
}

Rect Rect::sub_size_centered(const Size& size) const
{
    return deflate(size.width, size.height);
}

Rect Rect::inflate(const float expand) const
{
    return inflate(expand, expand);
}

Rect Rect::inflate(const float x, const float y) const
{
    return from_min_max(min.sub_dims(x, y), max.add_dims(x, y));
}

Rect Rect::deflate(const float shrink) const
{
    return deflate(shrink, shrink);
}

Rect Rect::deflate(const float x, const float y) const
{
    return from_min_max(min.add_dims(x, y), max.sub_dims(x, y));
}

void Rect::set_scale(const float scalar)
{
    set_size(size().scale(scalar));
}

Rect Rect::with_scale(const float scalar) const
{
    Rect rect = *this;
    rect.set_scale(scalar);
    return rect;
}

void Rect::set_scale_centered(const float scalar)
{
    set_size_centered(size().scale(scalar));
}

Rect Rect::with_scale_centered(const float scalar) const
{
    Rect rect = *this;
    rect.set_scale_centered(scalar);
    return rect;
}

void Rect::set_scale_anchored(const float scalar, const Anchor anchor)
{
    set_size_anchored(size().scale(scalar), anchor);
}

Rect Rect::with_scale_anchored(const float scalar, const Anchor anchor) const
{
    Rect rect = *this;
    rect.set_scale_anchored(scalar, anchor);
    return rect;
}

void Rect::swap_lengths()
{
    set_size(size().swap_dims());
}

Rect Rect::swapped_lengths() const
{
    return from_min_size(min, size().swap_dims());
}

void Rect::centered_swap_lengths()
{
    set_size_centered(size().swap_dims());
}

Rect Rect::centered_swapped_lengths() const
{
    return centered(center(), size().swap_dims());
}

void Rect::anchored_swap_lengths(const Anchor anchor)
{
    *this = anchored_swapped_lengths(anchor);
}

Rect Rect::anchored_swapped_lengths(const Anchor anchor) const
{
    return from_anchored_pivot(anchor, this->anchor(anchor),
                               size().swap_dims());
}

Rect Rect::add_padding(const Paddingf& padding) const
{
    return from_min_max(min.add_dims(padding.left, padding.top),
                        max.sub_dims(padding.right, padding.bottom));
}

Rect Rect::add_padding(const Padding& padding) const
{
    return add_padding(padding.to_paddingf());
}

Rect Rect::sub_padding(const Paddingf& padding) const
{
    return from_min_max(min.sub_dims(padding.left, padding.top),
                        max.add_dims(padding.right, padding.bottom));
}

Rect Rect::sub_padding(const Padding& padding) const
{
    return sub_padding(padding.to_paddingf());
}

void Rect::apply_padding(const Paddingf& padding)
{
    min = min.add_dims(padding.left, padding.top);
    max = max.sub_dims(padding.right, padding.bottom);
}

void Rect::apply_padding(const Padding& padding)
{
    apply_padding(padding.to_paddingf());
}

void Rect::remove_padding(const Paddingf& padding)
{
    min = min.sub_dims(padding.left, padding.top);
    max = max.add_dims(padding.right, padding.bottom);
}

void Rect::remove_padding(const Padding& padding)
{
    remove_padding(padding.to_paddingf());
}

Rect Rect::add_margin(const Marginf& margin) const
{
    return from_min_max(min, max.add_dims(margin.x(), margin.y()));
}

Rect Rect::add_margin(const Margin& margin) const
{
    return add_margin(margin.to_marginf());
}

Rect Rect::add_margin_centered(const Marginf& margin) const
{
    return from_min_max(min.sub_dims(margin.left, margin.top),
                        max.add_dims(margin.right, margin.bottom));
}

Rect Rect::add_margin_centered(const Margin& margin) const
{
    return add_margin_centered(margin.to_marginf());
}

Rect Rect::add_margin_anchored(const Marginf& margin,
                               const Anchor anchor) const
{
    return from_anchored_pivot(anchor, this->anchor(anchor),
                               size().add_margin(margin));
}

Rect Rect::add_margin_anchored(const Margin& margin, const Anchor anchor) const
{
    return add_margin_anchored(margin.to_marginf(), anchor);
}

Rect Rect::sub_margin(const Marginf& margin) const
{
    return from_min_max(min, max.sub_dims(margin.x(), margin.y()));
}

Rect Rect::sub_margin(const Margin& margin) const
{
    return sub_margin(margin.to_marginf());
}

Rect Rect::sub_margin_centered(const Marginf& margin) const
{
    return from_min_max(min.add_dims(margin.left, margin.top),
                        max.sub_dims(margin.right, margin.bottom));
}

Rect Rect::sub_margin_centered(const Margin& margin) const
{
    return sub_margin_centered(margin.to_marginf());
}

Rect Rect::sub_margin_anchored(const Marginf& margin,
                               const Anchor anchor) const
{
    return from_anchored_pivot(anchor, this->anchor(anchor),
                               size().sub_margin(margin));
}

Rect Rect::sub_margin_anchored(const Margin& margin, const Anchor anchor) const
{
    return sub_margin_anchored(margin.to_marginf(), anchor);
}

void Rect::apply_margin(const Marginf& margin)
{
    min = min.sub_dims(margin.left, margin.top);
    max = max.add_dims(margin.right, margin.bottom);
}

void Rect::apply_margin(const Margin& margin)
{
    apply_margin(margin.to_marginf());
}

void Rect::remove_margin(const Marginf& margin)
{
    min = min.add_dims(margin.left, margin.top);
    max = max.sub_dims(margin.right, margin.bottom);
}

void Rect::remove_margin(const Margin& margin)
{
    remove_margin(margin.to_marginf());
}

std::pair<Rect, Rect> Rect::split_from_left(const float length) const
{
    const float split = min.x + length;
    return { make_rect(min, { split, max.y }),
             make_rect({ split, min.y }, max) };
}

std::pair<Rect, Rect> Rect::split_from_top(const float length) const
{
    const float split = min.y + length;
    return { make_rect(min, { max.x, split }),
             make_rect({ min.x, split }, max) };
}

std::pair<Rect, Rect> Rect::split_from_right(const float length) const
{
    const float split = max.x - length;
    return { make_rect({ split, min.y }, max),
             make_rect(min, { split, max.y }) };
}

std::pair<Rect, Rect> Rect::split_from_bottom(const float length) const
{
    const float split = max.y - length;
    return { make_rect({ min.x, split }, max),
             make_rect(min, { max.x, split }) };
}

std::pair<Rect, Rect> Rect::split_horizontal() const
{
    const float mid_x = std::midpoint(min.x, max.x);
    return { from_min_max(min, { mid_x, max.y }),
             from_min_max({ mid_x, min.y }, max) };
}

std::pair<Rect, Rect> Rect::split_vertical() const
{
    const float mid_y = std::midpoint(min.y, max.y);
    return { from_min_max(min, { max.x, mid_y }),
             from_min_max({ min.x, mid_y }, max) };
}

Quadrants<Rect> Rect::into_quadrants() const
{
    const Pos mid = center();
    return { {
        make_rect(min, mid),
        make_rect({ mid.x, min.y }, { max.x, mid.y }),
        make_rect({ min.x, mid.y }, { mid.x, max.y }),
        make_rect(mid, max),
    } };
}

Rect Rect::left_adjacent(const float length) const
{
    return make_rect({ min.x - length, min.y }, left_bottom());
}

Rect Rect::top_adjacent(const float length) const
{
    return make_rect({ min.x, min.y - length }, right_top());
}

Rect Rect::right_adjacent(const float length) const
{
    return make_rect(right_top(), { max.x + length, max.y });
}

Rect Rect::bottom_adjacent(const float length) const
{
    return make_rect(left_bottom(), { max.x, max.y + length });
}

Rect Rect::left_top_adjacent(const Size& size) const
{
    return from_min_max(min - size, min);
}

Rect Rect::right_top_adjacent(const Size& size) const
{
    return from_min_max({ max.x, min.y - size.height },
                        { max.x + size.width, min.y });
}

Rect Rect::left_bottom_adjacent(const Size& size) const
{
    return from_min_max({ min.x - size.width, max.y },
                        { min.x, max.y + size.height });
}

Rect Rect::right_bottom_adjacent(const Size& size) const
{
    return from_min_max(max, max + size);
}

Rect Rect::anchor_rect(const Anchor anchor, const Placement placement,
                       const Size& thickness) const
{
    const float w = thickness.width;
    const float h = thickness.height;
    const float hw = thickness.half_width();
    const float hh = thickness.half_height();

    switch (anchor) {
        case Anchor::LeftTop:
            switch (placement) {
                case Placement::Inside:
                    return make_rect(min, min.add_dims(w, h));
                case Placement::Middle:
                    return make_rect(min.sub_dims(hw, hh),
                                     min.add_dims(hw, hh));
                case Placement::Outside:
                    return make_rect(min.sub_dims(w, h), min);
            }
            break;
        case Anchor::LeftCenter:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ min.x, min.y + h },
                                     { min.x + w, max.y - h });
                case Placement::Middle:
                    return make_rect({ min.x - hw, min.y + hh },
                                     { min.x + hw, max.y - hh });
                case Placement::Outside:
                    return make_rect({ min.x - w, min.y }, left_bottom());
            }
            break;
        case Anchor::LeftBottom:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ min.x, max.y - h },
                                     { min.x + w, max.y });
                case Placement::Middle:
                    return make_rect({ min.x - hw, max.y - hh },
                                     { min.x + hw, max.y + hh });
                case Placement::Outside:
                    return make_rect({ min.x - w, max.y },
                                     { min.x, max.y + h });
            }
            break;
        case Anchor::BottomCenter:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ min.x + w, max.y - h },
                                     { max.x - w, max.y });
                case Placement::Middle:
                    return make_rect({ min.x + hw, max.y - hh },
                                     { max.x - hw, max.y + hh });
                case Placement::Outside:
                    return make_rect(left_bottom(), { max.x, max.y + h });
            }
            break;
        case Anchor::RightBottom:
            switch (placement) {
                case Placement::Inside:
                    return make_rect(max.sub_dims(w, h), max);
                case Placement::Middle:
                    return make_rect(max.sub_dims(hw, hh),
                                     max.add_dims(hw, hh));
                case Placement::Outside:
                    return make_rect(max, max.add_dims(w, h));
            }
            break;
        case Anchor::RightCenter:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ max.x - w, min.y + h },
                                     { max.x, max.y - h });
                case Placement::Middle:
                    return make_rect({ max.x - hw, min.y + hh },
                                     { max.x + hw, max.y - hh });
                case Placement::Outside:
                    return make_rect(right_top(), { max.x + w, max.y });
            }
            break;
        case Anchor::RightTop:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ max.x - w, min.y },
                                     { max.x, min.y + h });
                case Placement::Middle:
                    return make_rect({ max.x - hw, min.y - hh },
                                     { max.x + hw, min.y + hh });
                case Placement::Outside:
                    return make_rect({ max.x, min.y - h },
                                     { max.x + w, min.y });
            }
            break;
        case Anchor::TopCenter:
            switch (placement) {
                case Placement::Inside:
                    return make_rect({ min.x + w, min.y },
                                     { max.x - w, min.y + h });
                case Placement::Middle:
                    return make_rect({ min.x + hw, min.y - hh },
                                     { max.x - hw, min.y + hh });
                case Placement::Outside:
                    return make_rect({ min.x, min.y - h }, right_top());
            }
            break;
        case Anchor::Center:
            switch (placement) {
                case Placement::Inside:
                    return make_rect(min.add_dims(w, h), max.sub_dims(w, h));
                case Placement::Middle:
                    return make_rect(min.add_dims(hw, hh),
                                     max.sub_dims(hw, hh));
                case Placement::Outside:
                    return *this;
            }
            break;
    }
    return *this;
}

Rect Rect::handle_rect(const Anchor anchor, const Placement placement,
                       const float size) const
{
    return anchor_rect(anchor, placement, Size::square(size));
}

Rect Rect::pivot_rect(const Anchor anchor, const Size& size) const
{
    return centered(this->anchor(anchor), size);
}

Rect Rect::square_pivot_rect(const Anchor anchor,
                             const float side_length) const
{
    return centered_square(this->anchor(anchor), side_length);
}

std::optional<Rect> Rect::subdivision_containing(const Pos& pos,
                                                 const uint32_t cols,
                                                 const uint32_t rows) const
{
    if (cols == 0 || rows == 0 || !contains(pos)) {
        return std::nullopt;
    }
    const Size cell = size().div_dims(static_cast<float>(cols),
                                      static_cast<float>(rows));
    const Pos index = ((pos - min) / cell).floor();
    return from_min_size(index * cell + min, cell);
}

std::optional<Rect> Rect::subdivision_containing_rect(const Rect& rect,
                                                      const uint32_t cols,
                                                      const uint32_t rows) const
{
    if (cols == 0 || rows == 0 || !contains_rect(rect)) {
        return std::nullopt;
    }
    const Size cell = size().div_dims(static_cast<float>(cols),
                                      static_cast<float>(rows));
    const Pos first = ((rect.min - min) / cell).floor();
    const Pos last = ((rect.max - min) / cell).floor();
    if (first != last) {
        return *this;
    }
    return from_min_size(first * cell + min, cell);
}

Rect Rect::scale_inside(const Size& size) const
{
    const Size own = this->size();
    const float scalar = own.aspect_ratio() >= size.aspect_ratio()
        ? own.height / size.height
        : own.width / size.width;
    return centered(center(), size.scale(scalar));
}

Rect Rect::scale_outside(const Size& size) const
{
    const Size own = this->size();
    const float scalar = own.aspect_ratio() >= size.aspect_ratio()
        ? own.width / size.width
        : own.height / size.height;
    return centered(center(), size.scale(scalar));
}

Rect Rect::scale_middle(const Size& size) const
{
    const Size own = this->size();
    const float scalar = own.min_dim() / size.min_dim();
    return centered(center(), size.scale(scalar));
}

Rect Rect::lerp(const Rect& other, const float t) const
{
    return from_min_max(min.lerp(other.min, t), max.lerp(other.max, t));
}

Rect Rect::clamped_lerp(const Rect& other, const float t) const
{
    return lerp(other, std::clamp(t, 0.0f, 1.0f));
}

/**
 * Build lookup key for the position of a point relative to the rectangle.
 * @return bit mask: 8 = x >= min.x, 4 = x < max.x, 2 = y >= min.y,
 *         1 = y < max.y
 */
static unsigned region_of(const Rect& rect, const Pos& pos)
{
    return (pos.x >= rect.min.x ? 8 : 0) | (pos.x < rect.max.x ? 4 : 0) |
        (pos.y >= rect.min.y ? 2 : 0) | (pos.y < rect.max.y ? 1 : 0);
}

float Rect::sdf(const Pos& pos) const
{
    switch (region_of(*this, pos)) {
        case 0b1111: // inside, nearest edge
            return std::max({ min.x - pos.x, pos.x - max.x, min.y - pos.y,
                              pos.y - max.y });
        case 0b1110: // below
            return pos.y - max.y;
        case 0b1101: // above
            return min.y - pos.y;
        case 0b1011: // right
            return pos.x - max.x;
        case 0b1010: // right-bottom corner
            return right_bottom().distance(pos);
        case 0b1001: // right-top corner
            return right_top().distance(pos);
        case 0b0111: // left
            return min.x - pos.x;
        case 0b0110: // left-bottom corner
            return left_bottom().distance(pos);
        case 0b0101: // left-top corner
            return left_top().distance(pos);
        case 0b1100:
        case 0b1000:
        case 0b0100:
            RECTKIT_CHECK(false, "rectangle min.y is greater than max.y");
            break;
        case 0b0011:
        case 0b0010:
        case 0b0001:
            RECTKIT_CHECK(false, "rectangle min.x is greater than max.x");
            break;
        case 0b0000:
            RECTKIT_CHECK(false, "rectangle min is greater than max");
            break;
    }
    return std::numeric_limits<float>::quiet_NaN();
}

Pos Rect::closest_point(const Pos& pos) const
{
    switch (region_of(*this, pos)) {
        case 0b1111: {
            // inside, snap to the nearest edge
            float nearest = pos.x - min.x;
            Pos closest = { min.x, pos.y };
            if (max.x - pos.x < nearest) {
                nearest = max.x - pos.x;
                closest = { max.x, pos.y };
            }
            if (pos.y - min.y < nearest) {
                nearest = pos.y - min.y;
                closest = { pos.x, min.y };
            }
            if (max.y - pos.y < nearest) {
                closest = { pos.x, max.y };
            }
            return closest;
        }
        case 0b1110:
            return { pos.x, max.y };
        case 0b1101:
            return { pos.x, min.y };
        case 0b1011:
            return { max.x, pos.y };
        case 0b1010:
            return right_bottom();
        case 0b1001:
            return right_top();
        case 0b0111:
            return { min.x, pos.y };
        case 0b0110:
            return left_bottom();
        case 0b0101:
            return left_top();
        case 0b1100:
        case 0b1000:
        case 0b0100:
            RECTKIT_CHECK(false, "rectangle min.y is greater than max.y");
            break;
        case 0b0011:
        case 0b0010:
        case 0b0001:
            RECTKIT_CHECK(false, "rectangle min.x is greater than max.x");
            break;
        case 0b0000:
            RECTKIT_CHECK(false, "rectangle min is greater than max");
            break;
    }
    return pos;
}

std::array<Pos, 4> Rect::corners() const
{
    return { left_top(), right_top(), left_bottom(), right_bottom() };
}

std::array<Pos, 4> Rect::corners_cw() const
{
    return { left_top(), right_top(), right_bottom(), left_bottom() };
}

std::array<Pos, 4> Rect::corners_ccw() const
{
    return { left_top(), left_bottom(), right_bottom(), right_top() };
}

Pos Rect::edge_midpoint(const Axial edge) const
{
    switch (edge) {
        case Axial::Right:
            return right_center();
        case Axial::Up:
            return top_center();
        case Axial::Left:
            return left_center();
        case Axial::Down:
            return bottom_center();
    }
    return center();
}

std::array<Pos, 2> Rect::edge_points_cw(const Axial edge) const
{
    switch (edge) {
        case Axial::Right:
            return { right_top(), right_bottom() };
        case Axial::Up:
            return { left_top(), right_top() };
        case Axial::Left:
            return { left_bottom(), left_top() };
        case Axial::Down:
            return { right_bottom(), left_bottom() };
    }
    return { center(), center() };
}

std::array<Pos, 2> Rect::edge_points_ccw(const Axial edge) const
{
    const std::array<Pos, 2> points = edge_points_cw(edge);
    return { points[1], points[0] };
}

std::array<Pos, 2> Rect::edge_points_min_max(const Axial edge) const
{
    switch (edge) {
        case Axial::Right:
            return { right_top(), right_bottom() };
        case Axial::Up:
            return { left_top(), right_top() };
        case Axial::Left:
            return { left_top(), left_bottom() };
        case Axial::Down:
            return { left_bottom(), right_bottom() };
    }
    return { center(), center() };
}

std::array<Pos, 2> Rect::edge_points_max_min(const Axial edge) const
{
    const std::array<Pos, 2> points = edge_points_min_max(edge);
    return { points[1], points[0] };
}

Rect Rect::floor() const
{
    return make_rect(min.floor(), max.floor());
}

Rect Rect::ceil() const
{
    return make_rect(min.ceil(), max.ceil());
}

Rect Rect::floor_ceil() const
{
    return make_rect(min.floor(), max.ceil());
}

Rect Rect::ceil_floor() const
{
    return make_rect(min.ceil(), max.floor());
}

Rect Rect::round() const
{
    return make_rect(min.round(), max.round());
}
