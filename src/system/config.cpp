// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace turion {

Config* Config::instance{NULL};

namespace {

/// Add keys present in defaults but missing from data, recursively
/// @return true if anything was added
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            modified |= merge_missing_defaults(data[it.key()], it.value());
        }
    }
    return modified;
}

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("[Config] Unknown log level '{}', using warn", name);
        return spdlog::level::warn;
    }
    return level;
}

} // namespace

json Config::get_default_config() {
    return {{"device",
             {{"host", ""},
              {"port", 8883},
              {"username", "bblp"},
              {"password", ""},
              {"serial", ""}}},
            {"timeouts",
             {{"connect_ms", 30000},
              {"reply_ms", 10000},
              {"probe_ms", 5000},
              {"reconnect_delay_ms", 1000}}},
            {"log", {{"level", "warn"}, {"to_file", false}, {"file", ""}}},
            {"print",
             {{"timelapse", true},
              {"bed_type", "auto"},
              {"bed_levelling", true},
              {"flow_calibration", true},
              {"vibration_calibration", true},
              {"layer_inspect", true},
              {"ams_mapping", json::array()}}}};
}

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        bool corrupt = false;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            if (!data.is_object()) {
                spdlog::error("[Config] {} does not hold a JSON object", config_path);
                corrupt = true;
            }
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            corrupt = true;
        }

        if (corrupt) {
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                LOG_WARN_INTERNAL("[Config] Could not back up corrupt config {}", config_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] initialized: device={}:{}", get<std::string>("/device/host", ""),
                  get<int>("/device/port", 8883));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            LOG_ERROR_INTERNAL("Failed to replace config file {}", path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

DeviceConnectionConfig Config::device_connection_config() {
    DeviceConnectionConfig config;
    config.host = get<std::string>("/device/host", "");
    config.port = get<int>("/device/port", config.port);
    config.username = get<std::string>("/device/username", config.username);
    config.password = get<std::string>("/device/password", "");
    config.serial = get<std::string>("/device/serial", "");
    config.connect_timeout_ms = get<uint32_t>("/timeouts/connect_ms", config.connect_timeout_ms);
    config.reply_timeout_ms = get<uint32_t>("/timeouts/reply_ms", config.reply_timeout_ms);
    config.probe_timeout_ms = get<uint32_t>("/timeouts/probe_ms", config.probe_timeout_ms);
    config.reconnect_delay_ms =
        get<uint32_t>("/timeouts/reconnect_delay_ms", config.reconnect_delay_ms);
    return config;
}

ProjectPrintOptions Config::default_print_options() {
    ProjectPrintOptions options;
    options.timelapse = get<bool>("/print/timelapse", options.timelapse);
    options.bed_type = get<std::string>("/print/bed_type", options.bed_type);
    options.bed_levelling = get<bool>("/print/bed_levelling", options.bed_levelling);
    options.flow_calibration = get<bool>("/print/flow_calibration", options.flow_calibration);
    options.vibration_calibration =
        get<bool>("/print/vibration_calibration", options.vibration_calibration);
    options.layer_inspect = get<bool>("/print/layer_inspect", options.layer_inspect);
    options.ams_mapping = get<std::vector<int>>("/print/ams_mapping", {});
    return options;
}

logging::LogConfig Config::log_config() {
    logging::LogConfig log;
    log.level = parse_level(get<std::string>("/log/level", "warn"));
    log.enable_file = get<bool>("/log/to_file", false);
    log.file_path = get<std::string>("/log/file", "");
    log.printer = get<std::string>("/device/host", "");
    return log;
}

} // namespace turion
