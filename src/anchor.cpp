// SPDX-License-Identifier: MIT
// Relative positions on a rectangle.
// Copyright (C) 2026 rectkit contributors

#include "anchor.hpp"

#include "check.hpp"

Anchor opposite(const Anchor anchor)
{
    switch (anchor) {
        case Anchor::LeftTop:
            return Anchor::RightBottom;
        case Anchor::LeftCenter:
            return Anchor::RightCenter;
        case Anchor::LeftBottom:
            return Anchor::RightTop;
        case Anchor::BottomCenter:
            return Anchor::TopCenter;
        case Anchor::RightBottom:
            return Anchor::LeftTop;
        case Anchor::RightCenter:
            return Anchor::LeftCenter;
        case Anchor::RightTop:
            return Anchor::LeftBottom;
        case Anchor::TopCenter:
            return Anchor::BottomCenter;
        case Anchor::Center:
            return Anchor::Center;
    }
    RECTKIT_CHECK(false, "unhandled anchor");
    return anchor;
}

Anchor mirror_horizontal(const Anchor anchor)
{
    switch (anchor) {
        case Anchor::LeftTop:
            return Anchor::RightTop;
        case Anchor::LeftCenter:
            return Anchor::RightCenter;
        case Anchor::LeftBottom:
            return Anchor::RightBottom;
        case Anchor::RightBottom:
            return Anchor::LeftBottom;
        case Anchor::RightCenter:
            return Anchor::LeftCenter;
        case Anchor::RightTop:
            return Anchor::LeftTop;
        case Anchor::BottomCenter:
        case Anchor::TopCenter:
        case Anchor::Center:
            return anchor;
    }
    RECTKIT_CHECK(false, "unhandled anchor");
    return anchor;
}

Anchor mirror_vertical(const Anchor anchor)
{
    switch (anchor) {
        case Anchor::LeftTop:
            return Anchor::LeftBottom;
        case Anchor::LeftBottom:
            return Anchor::LeftTop;
        case Anchor::BottomCenter:
            return Anchor::TopCenter;
        case Anchor::RightBottom:
            return Anchor::RightTop;
        case Anchor::RightTop:
            return Anchor::RightBottom;
        case Anchor::TopCenter:
            return Anchor::BottomCenter;
        case Anchor::LeftCenter:
        case Anchor::RightCenter:
        case Anchor::Center:
            return anchor;
    }
    RECTKIT_CHECK(false, "unhandled anchor");
    return anchor;
}

Anchor rotate(const Anchor anchor, const int steps)
{
    if (anchor == Anchor::Center) {
        return anchor;
    }

    const int count = static_cast<int>(anchor_perimeter.size());
    int index = (static_cast<int>(anchor) + steps) % count;
    if (index < 0) {
        index += count;
    }
    return anchor_perimeter[index];
}

const char* anchor_name(const Anchor anchor)
{
    switch (anchor) {
        case Anchor::LeftTop:
            return "LeftTop";
        case Anchor::LeftCenter:
            return "LeftCenter";
        case Anchor::LeftBottom:
            return "LeftBottom";
        case Anchor::BottomCenter:
            return "BottomCenter";
        case Anchor::RightBottom:
            return "RightBottom";
        case Anchor::RightCenter:
            return "RightCenter";
        case Anchor::RightTop:
            return "RightTop";
        case Anchor::TopCenter:
            return "TopCenter";
        case Anchor::Center:
            return "Center";
    }
    RECTKIT_CHECK(false, "unhandled anchor");
    return "";
}
