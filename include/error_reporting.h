// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

/**
 * @file error_reporting.h
 * @brief Convenience macros for internal error reporting
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (logged, never shown to the operator)
 * LOG_ERROR_INTERNAL("Telemetry handler threw: {}", e.what());
 *
 * // Fatal error for command-line front-ends (logged + printed to stderr)
 * REPORT_FATAL("Unable to reach printer at {}", host);
 * ```
 */

// ============================================================================
// Internal Errors (Log Only)
// ============================================================================

/**
 * @brief Log internal error
 *
 * Use for callback failures and protocol anomalies that don't require
 * operator action.
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

// ============================================================================
// Operator-Facing Errors (Log + stderr)
// ============================================================================

/**
 * @brief Report a fatal error from a command-line front-end
 *
 * Logs the error and writes it to stderr so it is visible even when logging
 * goes to syslog or a file.
 */
#define REPORT_FATAL(msg, ...)                                                                     \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::error("[USER] {}", formatted_msg);                                                 \
        fmt::print(stderr, "Error: {}\n", formatted_msg);                                          \
    } while (0)
