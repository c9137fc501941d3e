// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Per-session monotonically increasing sequence id
 *
 * Starts at 0. The device echoes the id back but replies are not matched on
 * it.
 */
class SequenceCounter {
  public:
    /// Return the current value, then increment
    uint64_t next() {
        return value_.fetch_add(1);
    }

    uint64_t peek() const {
        return value_.load();
    }

    void reset() {
        value_.store(0);
    }

  private:
    std::atomic<uint64_t> value_{0};
};

/**
 * @brief Options for starting a sliced project (.3mf) already stored on the device
 */
struct ProjectPrintOptions {
    std::string url;              ///< e.g. file:///sdcard/jobs/part.3mf
    std::vector<int> ams_mapping; ///< Filament slot per project filament; empty = no AMS
    int plate_id = 1;
    std::optional<std::string> task_name; ///< Unset or empty: base name of url
    bool timelapse = true;
    std::string bed_type = "auto";
    bool bed_levelling = true;
    bool flow_calibration = true;
    bool vibration_calibration = true;
    bool layer_inspect = true;
};

/**
 * @brief Builds outbound command documents
 *
 * Pure functions: the caller supplies the sequence id so the builders can be
 * tested without a session.
 */
class DeviceCommandBuilder {
  public:
    static json gcode_line(uint64_t sequence_id, const std::string& gcode);
    static json gcode_file(uint64_t sequence_id, const std::string& url);
    static json stop(uint64_t sequence_id);
    static json pause(uint64_t sequence_id);
    static json resume(uint64_t sequence_id);
    static json project_file(uint64_t sequence_id, const ProjectPrintOptions& options);

    /// Ask the device to publish a complete status frame
    static json push_all(uint64_t sequence_id);

    /// Text after the last '/' of a URL or path
    static std::string base_name(const std::string& url);

    /// Command name of an outbound document ("print.command" or "pushing.command")
    static std::string command_name(const json& msg);

  private:
    static json simple_print_command(uint64_t sequence_id, const char* command);
};

} // namespace turion
