// SPDX-License-Identifier: MIT
// Direction enumerations returned by vector and rectangle queries.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include <cstdint>

/** Eight compass directions, counter-clockwise starting with East. */
enum class Cardinal : uint8_t { E, Ne, N, Nw, W, Sw, S, Se };

/** Four axis-aligned directions, counter-clockwise starting with Right. */
enum class Axial : uint8_t { Right, Up, Left, Down };

/**
 * Get opposite compass direction.
 * @param dir source direction
 * @return direction pointing the other way
 */
Cardinal antipode(const Cardinal dir);

/**
 * Get human readable direction name.
 * @param dir compass direction
 * @return name, e.g. "Northeast"
 */
const char* cardinal_name(const Cardinal dir);

/** Check for North, East, South or West. */
bool is_primary(const Cardinal dir);
/** Check for one of the diagonal directions. */
bool is_secondary(const Cardinal dir);

bool is_northward(const Cardinal dir);
bool is_eastward(const Cardinal dir);
bool is_southward(const Cardinal dir);
bool is_westward(const Cardinal dir);

/**
 * Get opposite axial direction.
 * @param dir source direction
 * @return direction pointing the other way
 */
Axial opposite(const Axial dir);

/** Check for Left or Right. */
bool is_horizontal(const Axial dir);
/** Check for Up or Down. */
bool is_vertical(const Axial dir);
