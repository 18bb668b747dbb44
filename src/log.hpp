// SPDX-License-Identifier: MIT
// Logging.
// Copyright (C) 2026 rectkit contributors

#pragma once

#include <fmt/core.h>

#include <iostream>
#include <utility>

class Log {
public:
    /**
     * Print debug message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void debug(const fmt::format_string<Args...> fmt, Args&&... args)
    {
        if (verbose_flag()) {
            std::cout << fmt::format(fmt, std::forward<Args>(args)...)
                      << '\n';
        }
    }

    /**
     * Print error message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void error(const fmt::format_string<Args...> fmt, Args&&... args)
    {
        std::cerr << "ERROR: "
                  << fmt::format(fmt, std::forward<Args>(args)...) << '\n';
    }

    /**
     * Verbose output flag getter/setter.
     * @return reference to verbose flag
     */
    static bool& verbose_flag()
    {
        static bool verbose = false;
        return verbose;
    }
};
