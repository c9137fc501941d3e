// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_client.h"
#include "device_commands.h"

#include <optional>
#include <string>
#include <vector>

namespace turion {

/**
 * @brief Per-job printer settings carried by a slicer in its API key
 *
 * Slicers that only know the OctoPrint upload protocol have a single free
 * text field, the API key. It is used as a `key=value;key=value` list:
 *
 *   host=192.168.1.20;pass=12345678;ams_mapping=0,1;timelapse=true
 *
 * `host` and `pass` are required.
 */
struct JobSettings {
    std::string host;
    std::string user = "bblp";
    std::string pass;
    bool timelapse = false;
    std::string bed_type = "auto";
    bool bed_levelling = true;
    bool flow_calibration = true;
    bool vibration_calibration = true;
    bool layer_inspect = true;
    std::vector<int> ams_mapping;

    /// Connection parameters for the printer named by these settings
    DeviceConnectionConfig connection_config(const DeviceConnectionConfig& defaults = {}) const;

    /// Print options for a project at url
    ProjectPrintOptions project_options(const std::string& url,
                                        const std::string& task_name) const;
};

/**
 * @brief Parse the API key format
 *
 * Each `;` separated entry must be exactly one `key=value` pair. Boolean
 * values are true only for the literal "true". `ams_mapping` is a comma
 * separated list of integers; empty or absent means no AMS.
 *
 * @return nullopt on any malformed entry, bad integer or missing host/pass
 */
std::optional<JobSettings> parse_job_settings(const std::string& raw);

} // namespace turion
