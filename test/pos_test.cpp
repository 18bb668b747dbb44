// SPDX-License-Identifier: MIT
// Copyright (C) 2026 rectkit contributors

#include "pos.hpp"

#include "rect.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

TEST(PosTest, Construction)
{
    EXPECT_EQ(Pos::splat(3), (Pos { 3, 3 }));
    EXPECT_EQ(Pos::from_array({ 1, 2 }), (Pos { 1, 2 }));
    EXPECT_EQ(Pos::from_pair({ 4, 5 }), (Pos { 4, 5 }));
    EXPECT_EQ((Pos { 1, 2 }).yx(), (Pos { 2, 1 }));

    const Pos pt { 7, 8 };
    EXPECT_EQ(pt.to_array(), (std::array<float, 2> { 7, 8 }));
    EXPECT_EQ(pt.to_pair(), std::make_pair(7.0f, 8.0f));
    EXPECT_EQ(pt[0], 7);
    EXPECT_EQ(pt[1], 8);

    const Pos right = Pos::from_angle(0);
    EXPECT_FLOAT_EQ(right.x, 1);
    EXPECT_FLOAT_EQ(right.y, 0);
}

TEST(PosTest, Arithmetic)
{
    const Pos pt { 6, 8 };
    EXPECT_EQ((pt + Pos { 1, 2 }), (Pos { 7, 10 }));
    EXPECT_EQ((pt - Size { 1, 2 }), (Pos { 5, 6 }));
    EXPECT_EQ(pt * 0.5f, (Pos { 3, 4 }));
    EXPECT_EQ(pt / std::make_pair(2.0f, 4.0f), (Pos { 3, 2 }));
    EXPECT_EQ((pt % std::array<float, 2> { 4, 5 }), (Pos { 2, 3 }));
    EXPECT_EQ(-pt, (Pos { -6, -8 }));

    Pos acc = pt;
    acc += Pos { 1, 1 };
    acc -= Pos { 2, 2 };
    acc *= 2;
    acc /= 5;
    EXPECT_EQ(acc, (Pos { 2, 2.8f }));

    EXPECT_EQ((Pos { 2, 3 }).mul_add({ 2, 2 }, { 1, 1 }), (Pos { 5, 7 }));
}

TEST(PosTest, Remainder)
{
    // fmod keeps the sign of the dividend
    EXPECT_EQ((Pos { -7, 7 }) % 3.0f, (Pos { -1, 1 }));
    EXPECT_EQ((Pos { -7, 7 }).rem_euclid({ 3, 3 }), (Pos { 2, 1 }));
    EXPECT_EQ((Pos { -7, 7 }).div_euclid({ 3, 3 }), (Pos { -3, 2 }));
}

TEST(PosTest, Ordering)
{
    const Pos a { 0, 0 };
    const Pos b { 1, 1 };
    const Pos c { 1, 0 };
    const Pos d { 0, 1 };

    EXPECT_TRUE(a.lt(b));
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b > a);
    EXPECT_FALSE(a.lt(c));
    EXPECT_TRUE(a.le(c));
    EXPECT_TRUE(a <= c);
    EXPECT_TRUE(c >= a);
    EXPECT_FALSE(c.le(d));
    EXPECT_FALSE(c.ge(d));

    EXPECT_EQ(a.compare(a), std::partial_ordering::equivalent);
    EXPECT_EQ(a.compare(b), std::partial_ordering::less);
    EXPECT_EQ(a.compare(c), std::partial_ordering::less);
    EXPECT_EQ(b.compare(a), std::partial_ordering::greater);
    EXPECT_EQ(c.compare(d), std::partial_ordering::unordered);
}

TEST(PosTest, VectorQueries)
{
    const Pos pt { 3, 4 };
    EXPECT_FLOAT_EQ(pt.length(), 5);
    EXPECT_FLOAT_EQ(pt.length_squared(), 25);
    EXPECT_FLOAT_EQ(pt.distance({ 0, 0 }), 5);
    EXPECT_FLOAT_EQ(pt.distance_squared({ 3, 0 }), 16);
    EXPECT_FLOAT_EQ(pt.dot({ 1, 2 }), 11);
    EXPECT_FLOAT_EQ(pt.cross({ 1, 2 }), 2);

    const Pos unit = pt.normalized();
    EXPECT_FLOAT_EQ(unit.x, 0.6f);
    EXPECT_FLOAT_EQ(unit.y, 0.8f);

    EXPECT_TRUE(Pos::zero.normalized().is_nan());
}

TEST(PosTest, Angle)
{
    constexpr float pi = std::numbers::pi_v<float>;

    // screen up is positive
    EXPECT_FLOAT_EQ((Pos { 0, -1 }).angle(), pi / 2);
    EXPECT_FLOAT_EQ((Pos { 0, 1 }).angle(), -pi / 2);
    EXPECT_FLOAT_EQ((Pos { 0, 1 }).normalized_angle(), 3 * pi / 2);
}

TEST(PosTest, Cardinal)
{
    EXPECT_EQ((Pos { 1, 0 }).cardinal(), Cardinal::E);
    EXPECT_EQ((Pos { 1, -1 }).cardinal(), Cardinal::Ne);
    EXPECT_EQ((Pos { 0, -1 }).cardinal(), Cardinal::N);
    EXPECT_EQ((Pos { -1, -1 }).cardinal(), Cardinal::Nw);
    EXPECT_EQ((Pos { -1, 0 }).cardinal(), Cardinal::W);
    EXPECT_EQ((Pos { -1, 1 }).cardinal(), Cardinal::Sw);
    EXPECT_EQ((Pos { 0, 1 }).cardinal(), Cardinal::S);
    EXPECT_EQ((Pos { 1, 1 }).cardinal(), Cardinal::Se);

    // slightly below east is still east
    EXPECT_EQ((Pos { 10, 1 }).cardinal(), Cardinal::E);
}

TEST(PosTest, Axial)
{
    EXPECT_EQ((Pos { 1, 0 }).axial(), Axial::Right);
    EXPECT_EQ((Pos { 0, -1 }).axial(), Axial::Up);
    EXPECT_EQ((Pos { -1, 0 }).axial(), Axial::Left);
    EXPECT_EQ((Pos { 0, 1 }).axial(), Axial::Down);
    EXPECT_EQ((Pos { 5, 1 }).axial(), Axial::Right);
    EXPECT_EQ((Pos { 1, 5 }).axial(), Axial::Down);
}

TEST(PosTest, Perpendicular)
{
    const Pos pt { 0.5f, 0.25f };
    EXPECT_EQ(pt.perp_cw(), (Pos { -0.25f, 0.5f }));
    EXPECT_EQ(pt.perp_ccw(), (Pos { 0.25f, -0.5f }));
    EXPECT_EQ(pt.perp_cw().perp_ccw(), pt);
}

TEST(PosTest, ReflectRotate)
{
    EXPECT_EQ((Pos { 1, 1 }).reflect({ 0, -1 }), (Pos { 1, -1 }));
    EXPECT_EQ((Pos { 1, 0 }).rotate_by({ 0, 1 }), (Pos { 0, 1 }));
}

TEST(PosTest, Interpolation)
{
    const Pos a { 0, 10 };
    const Pos b { 10, 20 };
    EXPECT_EQ(a.lerp(b, 0.5f), (Pos { 5, 15 }));
    EXPECT_EQ(a.lerp(b, 2), (Pos { 20, 30 }));
    EXPECT_EQ(a.clamped_lerp(b, 2), b);
    EXPECT_EQ(a.clamped_lerp(b, -1), a);
    EXPECT_EQ(a.mid_point(b), (Pos { 5, 15 }));
}

TEST(PosTest, Clamp)
{
    EXPECT_EQ((Pos { -5, 50 }).clamp({ 0, 0 }, { 10, 10 }), (Pos { 0, 10 }));
    EXPECT_EQ((Pos { -5, 0.5f }).clamp_both(-1, 1), (Pos { -1, 0.5f }));
    EXPECT_EQ((Pos { 2, -2 }).clamp_uv(), (Pos { 1, 0 }));

    const Pos pt { 3, 4 };
    EXPECT_EQ(pt.clamp_length(1, 10), pt);
    EXPECT_EQ(pt.clamp_length_max(10), pt);
    EXPECT_FLOAT_EQ(pt.clamp_length(1, 2.5f).length(), 2.5f);
    EXPECT_FLOAT_EQ(pt.clamp_length_max(1).length(), 1);
    EXPECT_FLOAT_EQ(pt.clamp_length_min(10).length(), 10);
}

TEST(PosTest, ComponentWise)
{
    const Pos a { 1, 5 };
    const Pos b { 3, 2 };
    EXPECT_EQ(a.min(b), (Pos { 1, 2 }));
    EXPECT_EQ(a.max(b), (Pos { 3, 5 }));
    EXPECT_EQ(a.min_max(b), std::make_pair(Pos { 1, 2 }, Pos { 3, 5 }));

    const Pos frac { -1.5f, 2.25f };
    EXPECT_EQ(frac.floor(), (Pos { -2, 2 }));
    EXPECT_EQ(frac.ceil(), (Pos { -1, 3 }));
    EXPECT_EQ(frac.round(), (Pos { -2, 2 }));
    EXPECT_EQ(frac.trunc(), (Pos { -1, 2 }));
    EXPECT_EQ(frac.fract(), (Pos { -0.5f, 0.25f }));
    EXPECT_EQ(frac.abs(), (Pos { 1.5f, 2.25f }));
    EXPECT_EQ(frac.signum(), (Pos { -1, 1 }));
    EXPECT_EQ((Pos { 2, 4 }).recip(), (Pos { 0.5f, 0.25f }));
    EXPECT_EQ((Pos { 2, 4 }).copysign({ -1, 1 }), (Pos { -2, 4 }));

    const Pos deg = Pos { std::numbers::pi_v<float>, 0 }.to_degrees();
    EXPECT_FLOAT_EQ(deg.x, 180);
    EXPECT_FLOAT_EQ((Pos { 180, 0 }).to_radians().x,
                    std::numbers::pi_v<float>);

    EXPECT_TRUE(a.is_finite());
    EXPECT_FALSE((Pos { INFINITY, 0 }).is_finite());
    EXPECT_TRUE((Pos { 0, NAN }).is_nan());
}

TEST(PosTest, SnapToRect)
{
    const Rect rect { 0, 0, 10, 10 };
    EXPECT_EQ((Pos { 15, 5 }).snap_to_rect(rect), (Pos { 10, 5 }));
    EXPECT_EQ((Pos { -3, -3 }).snap_to_rect(rect), (Pos { 0, 0 }));
}

TEST(PosTest, Constants)
{
    EXPECT_EQ(Pos::zero, (Pos { 0, 0 }));
    EXPECT_EQ(Pos::one, (Pos { 1, 1 }));
    EXPECT_EQ(Pos::half, (Pos { 0.5f, 0.5f }));
    EXPECT_EQ(Pos::neg_one, (Pos { -1, -1 }));
    EXPECT_EQ(Pos::unit_x + Pos::unit_y, Pos::one);
}
