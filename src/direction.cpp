// SPDX-License-Identifier: MIT
// Direction enumerations returned by vector and rectangle queries.
// Copyright (C) 2026 rectkit contributors

#include "direction.hpp"

#include "check.hpp"

Cardinal antipode(const Cardinal dir)
{
    switch (dir) {
        case Cardinal::E:
            return Cardinal::W;
        case Cardinal::Ne:
            return Cardinal::Sw;
        case Cardinal::N:
            return Cardinal::S;
        case Cardinal::Nw:
            return Cardinal::Se;
        case Cardinal::W:
            return Cardinal::E;
        case Cardinal::Sw:
            return Cardinal::Ne;
        case Cardinal::S:
            return Cardinal::N;
        case Cardinal::Se:
            return Cardinal::Nw;
    }
    RECTKIT_CHECK(false, "unhandled direction");
    return dir;
}

const char* cardinal_name(const Cardinal dir)
{
    switch (dir) {
        case Cardinal::E:
            return "East";
        case Cardinal::Ne:
            return "Northeast";
        case Cardinal::N:
            return "North";
        case Cardinal::Nw:
            return "Northwest";
        case Cardinal::W:
            return "West";
        case Cardinal::Sw:
            return "Southwest";
        case Cardinal::S:
            return "South";
        case Cardinal::Se:
            return "Southeast";
    }
    RECTKIT_CHECK(false, "unhandled direction");
    return "";
}

bool is_primary(const Cardinal dir)
{
    return dir == Cardinal::N || dir == Cardinal::E || dir == Cardinal::S ||
        dir == Cardinal::W;
}

bool is_secondary(const Cardinal dir)
{
    return !is_primary(dir);
}

bool is_northward(const Cardinal dir)
{
    return dir == Cardinal::Nw || dir == Cardinal::N || dir == Cardinal::Ne;
}

bool is_eastward(const Cardinal dir)
{
    return dir == Cardinal::Ne || dir == Cardinal::E || dir == Cardinal::Se;
}

bool is_southward(const Cardinal dir)
{
    return dir == Cardinal::Se || dir == Cardinal::S || dir == Cardinal::Sw;
}

bool is_westward(const Cardinal dir)
{
    return dir == Cardinal::Sw || dir == Cardinal::W || dir == Cardinal::Nw;
}

Axial opposite(const Axial dir)
{
    switch (dir) {
        case Axial::Right:
            return Axial::Left;
        case Axial::Up:
            return Axial::Down;
        case Axial::Left:
            return Axial::Right;
        case Axial::Down:
            return Axial::Up;
    }
    RECTKIT_CHECK(false, "unhandled direction");
    return dir;
}

bool is_horizontal(const Axial dir)
{
    return dir == Axial::Left || dir == Axial::Right;
}

bool is_vertical(const Axial dir)
{
    return dir == Axial::Up || dir == Axial::Down;
}
