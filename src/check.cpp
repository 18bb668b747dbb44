// SPDX-License-Identifier: MIT
// Debug checks for geometry invariants.
// Copyright (C) 2026 rectkit contributors

#include "check.hpp"

#include "log.hpp"

#include <cstdlib>

void check_failed(const char* expr, const char* message, const char* file,
                  int line)
{
    Log::error("{}", message);
    Log::debug("Check `{}` failed at {}:{}", expr, file, line);
    std::abort();
}
