// SPDX-License-Identifier: MIT
// Copyright (C) 2026 rectkit contributors

#include "size.hpp"

#include <gtest/gtest.h>

#include <cmath>

TEST(SizeTest, Queries)
{
    const Size size { 8, 4 };
    EXPECT_EQ(size.area(), 32);
    EXPECT_EQ(size.aspect_ratio(), 2);
    EXPECT_EQ(size.half(), (Size { 4, 2 }));
    EXPECT_EQ(size.half_width(), 4);
    EXPECT_EQ(size.half_height(), 2);
    EXPECT_EQ(size.min_dim(), 4);
    EXPECT_EQ(size.max_dim(), 8);
    EXPECT_TRUE(size.is_horizontal());
    EXPECT_FALSE(size.is_vertical());
    EXPECT_FALSE(size.is_square());
    EXPECT_EQ(size.inner_square(), Size::square(4));
    EXPECT_EQ(size.swap_dims(), (Size { 4, 8 }));
    EXPECT_EQ(size.negate(), (Size { -8, -4 }));
    EXPECT_EQ(size.scale(0.5f), (Size { 4, 2 }));
}

TEST(SizeTest, Positive)
{
    EXPECT_TRUE((Size { 0, 0 }).is_positive());
    EXPECT_TRUE((Size { 1, 2 }).is_positive());
    EXPECT_FALSE((Size { -1, 2 }).is_positive());
    EXPECT_FALSE((Size { 1, -2 }).is_positive());
}

TEST(SizeTest, Square)
{
    EXPECT_TRUE(Size::square(3).is_square());
    EXPECT_TRUE((Size { 10, 10.5f }).is_square_fuzzy(0.5f));
    EXPECT_FALSE((Size { 10, 10.5f }).is_square_fuzzy(0.25f));
}

TEST(SizeTest, ZeroHeight)
{
    EXPECT_TRUE(std::isinf((Size { 1, 0 }).aspect_ratio()));
    EXPECT_TRUE(std::isnan((Size { 0, 0 }).aspect_ratio()));
}

TEST(SizeTest, Operators)
{
    const Size size { 6, 9 };
    EXPECT_EQ((size + Size { 1, 1 }), (Size { 7, 10 }));
    EXPECT_EQ(size - 1.0f, (Size { 5, 8 }));
    EXPECT_EQ(size * std::make_pair(2.0f, 3.0f), (Size { 12, 27 }));
    EXPECT_EQ((size / std::array<float, 2> { 2, 3 }), (Size { 3, 3 }));
    EXPECT_EQ(size % 4.0f, (Size { 2, 1 }));
    EXPECT_EQ(-size, (Size { -6, -9 }));
    EXPECT_EQ(size[0], 6);
    EXPECT_EQ(size[1], 9);
}

TEST(SizeTest, Margin)
{
    const Size size { 10, 10 };
    EXPECT_EQ(size.add_margin(Margin { 1, 2, 3, 4 }), (Size { 14, 16 }));
    EXPECT_EQ(size.sub_margin(Marginf::symmetric(1, 2)), (Size { 8, 6 }));
}

TEST(SizeTest, Constants)
{
    EXPECT_EQ(Size::zero, (Size { 0, 0 }));
    EXPECT_EQ(Size::one, (Size { 1, 1 }));
    EXPECT_EQ(Size::vga, (Size { 640, 480 }));
    EXPECT_EQ(Size::fhd, (Size { 1920, 1080 }));
    EXPECT_EQ(Size::uhd_4k, Size::fhd * 2.0f);
    EXPECT_EQ(Size::uhd_8k, Size::uhd_4k * 2.0f);
}

TEST(AspectRatioTest, Conversion)
{
    const AspectRatio wide = AspectRatio::from_dims(16, 9);
    EXPECT_FLOAT_EQ(wide.width_from_height(9), 16);
    EXPECT_FLOAT_EQ(wide.height_from_width(1920), 1080);

    const AspectRatio square = AspectRatio::from_size(Size::square(5));
    EXPECT_EQ(square.ratio, 1);
}
