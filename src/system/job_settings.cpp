// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "job_settings.h"

#include <spdlog/spdlog.h>

#include <map>
#include <sstream>

namespace turion {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, delim)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (s.empty() || s.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) {
        return false;
    }
    size_t pos = 0;
    try {
        out = std::stoi(s, &pos);
    } catch (const std::exception&) {
        return false;
    }
    return pos == s.size();
}

bool flag(const std::map<std::string, std::string>& values, const std::string& key, bool def) {
    auto it = values.find(key);
    if (it == values.end()) {
        return def;
    }
    return it->second == "true";
}

} // namespace

std::optional<JobSettings> parse_job_settings(const std::string& raw) {
    std::map<std::string, std::string> values;
    for (const std::string& entry : split(raw, ';')) {
        std::vector<std::string> kv = split(entry, '=');
        if (kv.size() != 2) {
            spdlog::debug("[Job Settings] Malformed entry '{}'", entry);
            return std::nullopt;
        }
        values[kv[0]] = kv[1];
    }

    JobSettings settings;
    auto host = values.find("host");
    auto pass = values.find("pass");
    if (host == values.end() || host->second.empty() || pass == values.end() ||
        pass->second.empty()) {
        spdlog::debug("[Job Settings] Missing host or pass");
        return std::nullopt;
    }
    settings.host = host->second;
    settings.pass = pass->second;

    auto user = values.find("user");
    if (user != values.end()) {
        settings.user = user->second;
    }
    auto bed_type = values.find("bed_type");
    if (bed_type != values.end()) {
        settings.bed_type = bed_type->second;
    }

    settings.timelapse = flag(values, "timelapse", false);
    settings.bed_levelling = flag(values, "bed_levelling", true);
    settings.flow_calibration = flag(values, "flow_calibration", true);
    settings.vibration_calibration = flag(values, "vibration_calibration", true);
    settings.layer_inspect = flag(values, "layer_inspect", true);

    auto mapping = values.find("ams_mapping");
    if (mapping != values.end() && !mapping->second.empty()) {
        for (const std::string& slot : split(mapping->second, ',')) {
            int value = 0;
            if (!parse_int(slot, value)) {
                spdlog::debug("[Job Settings] Bad ams_mapping entry '{}'", slot);
                return std::nullopt;
            }
            settings.ams_mapping.push_back(value);
        }
    }

    return settings;
}

DeviceConnectionConfig
JobSettings::connection_config(const DeviceConnectionConfig& defaults) const {
    DeviceConnectionConfig config = defaults;
    config.host = host;
    config.username = user;
    config.password = pass;
    config.serial.clear();
    return config;
}

ProjectPrintOptions JobSettings::project_options(const std::string& url,
                                                 const std::string& task_name) const {
    ProjectPrintOptions options;
    options.url = url;
    options.task_name = task_name;
    options.ams_mapping = ams_mapping;
    options.timelapse = timelapse;
    options.bed_type = bed_type;
    options.bed_levelling = bed_levelling;
    options.flow_calibration = flow_calibration;
    options.vibration_calibration = vibration_calibration;
    options.layer_inspect = layer_inspect;
    return options;
}

} // namespace turion
