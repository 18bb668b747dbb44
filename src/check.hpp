// SPDX-License-Identifier: MIT
// Debug checks for geometry invariants.
// Copyright (C) 2026 rectkit contributors

#pragma once

// RECTKIT_CHECKS is normally set by the build system; fall back to the
// usual NDEBUG convention when it is not.
#ifndef RECTKIT_CHECKS
#ifdef NDEBUG
#define RECTKIT_CHECKS 0
#else
#define RECTKIT_CHECKS 1
#endif
#endif

/**
 * Report failed check and terminate the process.
 * @param expr text of the failed expression
 * @param message description of the violated invariant
 * @param file,line location of the check
 */
[[noreturn]] void check_failed(const char* expr, const char* message,
                               const char* file, int line);

/**
 * Check invariant, compiled out when RECTKIT_CHECKS is 0.
 * @param cond invariant expression
 * @param msg message printed on failure
 */
#if RECTKIT_CHECKS
#define RECTKIT_CHECK(cond, msg)                                \
    ((cond) ? static_cast<void>(0)                              \
            : check_failed(#cond, msg, __FILE__, __LINE__))
#else
#define RECTKIT_CHECK(cond, msg) static_cast<void>(0)
#endif
