// SPDX-License-Identifier: MIT
// Object size.
// Copyright (C) 2026 rectkit contributors

#include "size.hpp"

const Size Size::zero = { 0, 0 };
const Size Size::one = { 1, 1 };
const Size Size::vga = { 640, 480 };
const Size Size::hd = { 1280, 720 };
const Size Size::fhd = { 1920, 1080 };
const Size Size::qhd = { 2560, 1440 };
const Size Size::uhd_4k = { 3840, 2160 };
const Size Size::uhd_8k = { 7680, 4320 };
