// SPDX-License-Identifier: MIT
// Copyright (C) 2026 rectkit contributors

#include "anchor.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(AnchorTest, Opposite)
{
    EXPECT_EQ(opposite(Anchor::LeftTop), Anchor::RightBottom);
    EXPECT_EQ(opposite(Anchor::LeftCenter), Anchor::RightCenter);
    EXPECT_EQ(opposite(Anchor::LeftBottom), Anchor::RightTop);
    EXPECT_EQ(opposite(Anchor::TopCenter), Anchor::BottomCenter);
    EXPECT_EQ(opposite(Anchor::Center), Anchor::Center);

    for (const Anchor anchor : anchor_all) {
        EXPECT_EQ(opposite(opposite(anchor)), anchor) << anchor_name(anchor);
    }
}

TEST(AnchorTest, Mirror)
{
    EXPECT_EQ(mirror_horizontal(Anchor::LeftTop), Anchor::RightTop);
    EXPECT_EQ(mirror_horizontal(Anchor::TopCenter), Anchor::TopCenter);
    EXPECT_EQ(mirror_vertical(Anchor::LeftTop), Anchor::LeftBottom);
    EXPECT_EQ(mirror_vertical(Anchor::RightCenter), Anchor::RightCenter);

    // both mirrors together give the opposite anchor
    for (const Anchor anchor : anchor_all) {
        EXPECT_EQ(mirror_vertical(mirror_horizontal(anchor)),
                  opposite(anchor))
            << anchor_name(anchor);
    }
}

TEST(AnchorTest, Rotate)
{
    EXPECT_EQ(rotate(Anchor::LeftTop, 1), Anchor::LeftCenter);
    EXPECT_EQ(rotate(Anchor::LeftTop, -1), Anchor::TopCenter);
    EXPECT_EQ(rotate(Anchor::TopCenter, 1), Anchor::LeftTop);
    EXPECT_EQ(rotate(Anchor::LeftTop, 4), Anchor::RightBottom);
    EXPECT_EQ(rotate(Anchor::RightTop, -10), Anchor::RightBottom);
    EXPECT_EQ(rotate(Anchor::Center, 3), Anchor::Center);

    for (const Anchor anchor : anchor_perimeter) {
        EXPECT_EQ(rotate(anchor, 4), opposite(anchor)) << anchor_name(anchor);
        EXPECT_EQ(rotate(anchor, 8), anchor) << anchor_name(anchor);
    }
}

TEST(AnchorTest, Names)
{
    EXPECT_EQ(std::string(anchor_name(Anchor::LeftTop)), "LeftTop");
    EXPECT_EQ(std::string(anchor_name(Anchor::BottomCenter)), "BottomCenter");
    EXPECT_EQ(std::string(anchor_name(Anchor::Center)), "Center");
}

TEST(AnchorTest, Numbering)
{
    EXPECT_EQ(static_cast<int>(Anchor::LeftTop), 0);
    EXPECT_EQ(static_cast<int>(Anchor::TopCenter), 7);
    EXPECT_EQ(static_cast<int>(Anchor::Center), 8);
    EXPECT_EQ(anchor_perimeter.size(), 8U);
    EXPECT_EQ(anchor_all.back(), Anchor::Center);
}
