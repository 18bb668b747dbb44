// SPDX-License-Identifier: MIT
// Geometric primitives.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include "anchor.hpp"
#include "direction.hpp"
#include "inset.hpp"
#include "pos.hpp"
#include "rect.hpp"
#include "size.hpp"
