// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file turion_inspector.cpp
 * @brief Standalone diagnostic tool for a LAN-mode printer
 *
 * Usage: turion_inspector <host> [access_code] [options]
 * Example: turion_inspector 192.168.1.20 12345678
 *
 * Reads the printer serial number from its TLS certificate. With an access
 * code it also connects, asks for a full status report and dumps it.
 */

#include "device_client.h"
#include "device_identity.h"
#include "error_reporting.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>

using namespace turion;

namespace {

// Collects the first frame that carries more than a handful of fields
struct InspectorState {
    std::mutex mutex;
    std::condition_variable cv;
    bool received = false;
    json status;
};

void print_header(const std::string& title) {
    std::cout << "\n== " << title << " ==\n";
}

void print_kv(const std::string& key, const std::string& value) {
    std::cout << "  " << key << ": " << value << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <host> [access_code] [options]\n";
        std::cerr << "Example: " << argv[0] << " 192.168.1.20 12345678\n";
        std::cerr << "\nOptions:\n";
        std::cerr << "  --port N        MQTT/TLS port (default 8883)\n";
        std::cerr << "  --user NAME     MQTT username (default bblp)\n";
        std::cerr << "  --timeout MS    Connect and status timeout (default 15000)\n";
        std::cerr << "  -v              Verbose logging (repeat for more)\n";
        return 1;
    }

    DeviceConnectionConfig config;
    config.host = argv[1];
    config.connect_timeout_ms = 15000;
    int verbosity = 0;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            config.port = std::atoi(argv[++i]);
        } else if (arg == "--user" && i + 1 < argc) {
            config.username = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            config.connect_timeout_ms = static_cast<uint32_t>(std::atoi(argv[++i]));
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == 'v') {
            verbosity += static_cast<int>(arg.size()) - 1;
        } else if (config.password.empty() && arg[0] != '-') {
            config.password = arg;
        }
    }

    logging::LogConfig log_config;
    log_config.level = logging::level_from_verbosity(verbosity);
    log_config.printer = config.host;
    logging::init(log_config);

    print_header("TurionLink Inspector");
    print_kv("Target", config.host + ":" + std::to_string(config.port));

    std::string identity;
    DeviceError err = probe_device_identity(config.host, config.port, 5000, identity);
    if (!err) {
        REPORT_FATAL("{} ({})", err.message, err.detail);
        return 1;
    }
    print_kv("Serial number", identity);
    print_kv("Report topic", "device/" + identity + "/report");
    print_kv("Request topic", "device/" + identity + "/request");

    if (config.password.empty()) {
        return 0;
    }

    config.serial = identity;
    InspectorState state;
    DeviceClient client(config);

    client.set_telemetry_handler([&state](const json& frame) {
        // Incremental frames carry a few keys; the pushall answer carries everything
        auto print = frame.find("print");
        if (print == frame.end() || !print->is_object() || print->size() < 10) {
            return;
        }
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.received) {
            state.status = frame;
            state.received = true;
            state.cv.notify_all();
        }
    });

    std::cout << "\nConnecting..." << std::endl;
    err = client.connect();
    if (!err) {
        REPORT_FATAL("{}", err.message);
        return 1;
    }

    err = client.request_full_status();
    if (!err) {
        REPORT_FATAL("Status request failed: {}", err.message);
        client.disconnect();
        return 1;
    }

    bool received = false;
    json status;
    {
        std::unique_lock<std::mutex> lock(state.mutex);
        received = state.cv.wait_for(lock, std::chrono::milliseconds(config.connect_timeout_ms),
                                     [&state] { return state.received; });
        status = state.status;
    }
    client.disconnect();

    if (!received) {
        REPORT_FATAL("No full status report within {}ms", config.connect_timeout_ms);
        return 1;
    }

    const json& print = status["print"];
    print_header("Printer Status");
    for (const char* key : {"gcode_state", "mc_percent", "mc_remaining_time", "subtask_name",
                            "nozzle_temper", "bed_temper", "print_error", "wifi_signal"}) {
        if (print.contains(key)) {
            print_kv(key, print[key].dump());
        }
    }

    print_header("Full Report");
    std::cout << status.dump(2) << std::endl;
    return 0;
}
