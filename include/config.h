// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_client.h"
#include "device_commands.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages configuration from a JSON file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access. Missing keys are filled from defaults
 * on init() so every documented path exists afterwards.
 *
 * Layout:
 * ```json
 * {
 *   "device":   { "host": "", "port": 8883, "username": "bblp", "password": "", "serial": "" },
 *   "timeouts": { "connect_ms": 30000, "reply_ms": 10000, "probe_ms": 5000,
 *                 "reconnect_delay_ms": 1000 },
 *   "log":      { "level": "warn", "to_file": false, "file": "" },
 *   "print":    { "timelapse": true, "bed_type": "auto", "bed_levelling": true,
 *                 "flow_calibration": true, "vibration_calibration": true,
 *                 "layer_inspect": true, "ams_mapping": [] }
 * }
 * ```
 *
 * Thread safety: Not thread-safe. Initialize once at startup and access from
 * the main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/turion-link/config.json");
 * std::string host = cfg->get<std::string>("/device/host", "");
 * cfg->set<int>("/timeouts/reply_ms", 15000);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A corrupt file is
     * moved aside to `<path>.corrupt` and replaced by defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds another type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save().
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    /// Replace everything with defaults (in memory)
    void reset_to_defaults();

    /// Connection parameters from /device and /timeouts
    DeviceConnectionConfig device_connection_config();

    /// Print defaults from /print (url left empty)
    ProjectPrintOptions default_print_options();

    /// Logging setup from /log
    logging::LogConfig log_config();

    /// Default document
    static json get_default_config();

    static Config* get_instance();
};

} // namespace turion
