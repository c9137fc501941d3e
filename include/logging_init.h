// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

namespace turion {
namespace logging {

/**
 * @brief Logger setup for the TurionLink tools
 *
 * Console output always goes to stderr; stdout is reserved for the tools'
 * own report. A print job can run for hours, so the tools can also keep a
 * rotating per-printer log file that survives the terminal.
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;

    bool enable_file = false;
    std::string file_path; ///< Empty: default_log_path(printer)
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;

    /// Printer host or serial; names the logger and the default log file
    std::string printer;
};

/**
 * @brief Install the default logger
 *
 * Safe to call again to reconfigure. An unwritable log file is reported on
 * stderr and logging continues on the console.
 *
 * @return false if the file sink was requested but could not be opened
 */
bool init(const LogConfig& config);

/// $XDG_STATE_HOME/turion-link/<printer>.log, falling back to ~/.local/state, then /tmp
std::string default_log_path(const std::string& printer);

/**
 * @brief Lower the base level one step per -v
 *
 * warn + 1 = info, + 2 = debug, + 3 = trace. Negative counts keep the base.
 */
spdlog::level::level_enum
level_from_verbosity(int verbosity, spdlog::level::level_enum base = spdlog::level::warn);

} // namespace logging
} // namespace turion
