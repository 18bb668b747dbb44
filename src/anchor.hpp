// SPDX-License-Identifier: MIT
// Relative positions on a rectangle.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include <array>
#include <cstdint>

/**
 * Named position on a rectangle: four corners, four edge midpoints and
 * the center. Perimeter anchors are numbered counter-clockwise starting
 * from the left-top corner.
 */
enum class Anchor : uint8_t {
    LeftTop,
    LeftCenter,
    LeftBottom,
    BottomCenter,
    RightBottom,
    RightCenter,
    RightTop,
    TopCenter,
    Center,
};

/** Handle placement relative to the boundary of a rectangle. */
enum class Placement : uint8_t {
    Inside,  ///< Flush within the boundary
    Middle,  ///< Centered on the boundary
    Outside, ///< Beyond the boundary
};

/** Perimeter anchors in counter-clockwise order. */
inline constexpr std::array<Anchor, 8> anchor_perimeter = {
    Anchor::LeftTop,     Anchor::LeftCenter,  Anchor::LeftBottom,
    Anchor::BottomCenter, Anchor::RightBottom, Anchor::RightCenter,
    Anchor::RightTop,    Anchor::TopCenter,
};

/** All anchors including the center. */
inline constexpr std::array<Anchor, 9> anchor_all = {
    Anchor::LeftTop,     Anchor::LeftCenter,  Anchor::LeftBottom,
    Anchor::BottomCenter, Anchor::RightBottom, Anchor::RightCenter,
    Anchor::RightTop,    Anchor::TopCenter,   Anchor::Center,
};

/**
 * Get anchor on the opposite side of the center (e.g. LeftTop for
 * RightBottom). Center is mapped to itself.
 * @param anchor source anchor
 * @return opposite anchor
 */
Anchor opposite(const Anchor anchor);

/**
 * Swap left and right sides of the anchor.
 */
Anchor mirror_horizontal(const Anchor anchor);

/**
 * Swap top and bottom sides of the anchor.
 */
Anchor mirror_vertical(const Anchor anchor);

/**
 * Rotate anchor along the perimeter.
 * @param anchor source anchor, Center is never rotated
 * @param steps number of counter-clockwise steps (45 degrees each),
 *              negative values rotate clockwise
 * @return rotated anchor
 */
Anchor rotate(const Anchor anchor, const int steps);

/**
 * Get anchor name.
 * @param anchor anchor to describe
 * @return anchor name, e.g. "LeftTop"
 */
const char* anchor_name(const Anchor anchor);
