// SPDX-License-Identifier: MIT
// Copyright (C) 2026 rectkit contributors

#include "check.hpp"

#include "rect.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

#if RECTKIT_CHECKS

TEST(CheckDeathTest, InvertedRect)
{
    EXPECT_DEATH(Rect::from_min_max({ 10, 10 }, { 0, 0 }),
                 "min is greater than max");
}

TEST(CheckDeathTest, NegativeSize)
{
    EXPECT_DEATH(Rect(0, 0, -1, 5), "size is negative");
    EXPECT_DEATH(Rect::from_min_size({ 0, 0 }, { 5, -1 }), "size is negative");
}

TEST(CheckDeathTest, InvertedClampBounds)
{
    EXPECT_DEATH((Pos { 0, 0 }).clamp({ 1, 1 }, { 0, 0 }), "inverted");
}

TEST(CheckDeathTest, QuadrantIndex)
{
    const Quadrants<Rect> quads = Rect(0, 0, 2, 2).into_quadrants();
    EXPECT_DEATH(quads(2, 0), "quadrant index out of range");
}

TEST(CheckDeathTest, MalformedDistance)
{
    Rect rect;
    rect.min = { 10, 0 };
    rect.max = { 0, 10 };
    EXPECT_DEATH(rect.sdf({ 5, 5 }), "min.x is greater than max.x");
    EXPECT_DEATH(rect.closest_point({ 5, 5 }), "min.x is greater than max.x");
}

TEST(CheckDeathTest, UnhandledEnum)
{
    const Anchor anchor = static_cast<Anchor>(42);
    EXPECT_DEATH(opposite(anchor), "unhandled anchor");
    EXPECT_DEATH(mirror_horizontal(anchor), "unhandled anchor");
    EXPECT_DEATH(mirror_vertical(anchor), "unhandled anchor");
    EXPECT_DEATH(anchor_name(anchor), "unhandled anchor");

    EXPECT_DEATH(antipode(static_cast<Cardinal>(42)), "unhandled direction");
    EXPECT_DEATH(cardinal_name(static_cast<Cardinal>(42)),
                 "unhandled direction");
    EXPECT_DEATH(opposite(static_cast<Axial>(42)), "unhandled direction");
}

TEST(CheckDeathTest, ComponentIndex)
{
    Pos pos { 1, 2 };
    EXPECT_DEATH(pos[2], "position index out of range");
    const Pos fixed { 1, 2 };
    EXPECT_DEATH(fixed[5], "position index out of range");
    const Size size { 3, 4 };
    EXPECT_DEATH(size[2], "size index out of range");
}

#else

TEST(CheckTest, UnhandledEnum)
{
    const Anchor anchor = static_cast<Anchor>(42);
    EXPECT_EQ(opposite(anchor), anchor);
    EXPECT_EQ(std::string(anchor_name(anchor)), "");
    EXPECT_EQ(std::string(cardinal_name(static_cast<Cardinal>(42))), "");
}

TEST(CheckTest, MalformedDistance)
{
    Rect rect;
    rect.min = { 10, 0 };
    rect.max = { 0, 10 };
    EXPECT_TRUE(std::isnan(rect.sdf({ 5, 5 })));
    EXPECT_EQ(rect.closest_point({ 5, 5 }), (Pos { 5, 5 }));
}

#endif // RECTKIT_CHECKS
