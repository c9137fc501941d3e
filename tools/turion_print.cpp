// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file turion_print.cpp
 * @brief Start a project that is already on the printer's storage and follow it
 *
 * Usage: turion_print <host> <username> <access_code> <project> [options]
 * Example: turion_print 192.168.1.20 bblp 12345678 jobs/part.3mf --use-ams
 *
 * <project> is a path on the printer's SD card or a full URL
 * (file:///sdcard/..., ftp://...). Exits 0 when the printer reports FINISH,
 * 1 on any error; a print error stops the job.
 */

#include "config.h"
#include "device_client.h"
#include "error_reporting.h"
#include "json_utils.h"
#include "logging_init.h"
#include "print_state_tracker.h"
#include "project_submitter.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

using namespace turion;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <host> <username> <access_code> <project> [options]\n";
    std::cerr << "Example: " << argv0 << " 192.168.1.20 bblp 12345678 jobs/part.3mf\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --use-ams              Use the AMS (default mapping 0,1,2,3)\n";
    std::cerr << "  --ams-mapping A,B,...  Filament slot per project filament\n";
    std::cerr << "  --plate N              Plate to print (default 1)\n";
    std::cerr << "  --serial SERIAL        Skip the certificate probe\n";
    std::cerr << "  --config PATH          Load timeouts and print defaults from PATH\n";
    std::cerr << "  --no-timelapse         Disable timelapse recording\n";
    std::cerr << "  --log-file [PATH]      Also log to PATH (default: per-printer state file)\n";
    std::cerr << "  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n";
}

bool parse_mapping(const std::string& text, std::vector<int>& mapping) {
    mapping.clear();
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        char* end = nullptr;
        long value = std::strtol(item.c_str(), &end, 10);
        if (item.empty() || *end != '\0') {
            return false;
        }
        mapping.push_back(static_cast<int>(value));
    }
    return !mapping.empty();
}

std::string project_url(const std::string& project) {
    if (project.find("://") != std::string::npos) {
        return project;
    }
    std::string dir;
    std::string file = project;
    size_t slash = project.find_last_of('/');
    if (slash != std::string::npos) {
        dir = project.substr(0, slash);
        file = project.substr(slash + 1);
    }
    return ProjectSubmitter::storage_uri(dir, file);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 5) {
        print_usage(argv[0]);
        return 1;
    }

    DeviceConnectionConfig connection;
    ProjectPrintOptions options;
    std::string config_path;
    int verbosity = 0;
    bool use_ams = false;
    bool mapping_given = false;
    bool no_timelapse = false;
    int plate_id = 1;
    std::string serial;
    bool log_to_file = false;
    std::string log_file;

    for (int i = 5; i < argc; i++) {
        if (strcmp(argv[i], "--use-ams") == 0) {
            use_ams = true;
        } else if (strcmp(argv[i], "--ams-mapping") == 0 && i + 1 < argc) {
            if (!parse_mapping(argv[++i], options.ams_mapping)) {
                std::cerr << "Invalid --ams-mapping: " << argv[i] << "\n";
                return 1;
            }
            mapping_given = true;
        } else if (strcmp(argv[i], "--plate") == 0 && i + 1 < argc) {
            plate_id = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--serial") == 0 && i + 1 < argc) {
            serial = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--no-timelapse") == 0) {
            no_timelapse = true;
        } else if (strcmp(argv[i], "--log-file") == 0) {
            log_to_file = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                log_file = argv[++i];
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbosity++;
        } else if (argv[i][0] == '-' && argv[i][1] == 'v') {
            for (const char* p = argv[i] + 1; *p == 'v'; ++p) {
                verbosity++;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    logging::LogConfig log_config;
    if (!config_path.empty()) {
        Config* cfg = Config::get_instance();
        cfg->init(config_path);
        connection = cfg->device_connection_config();
        std::vector<int> mapping = options.ams_mapping;
        options = cfg->default_print_options();
        if (mapping_given) {
            options.ams_mapping = mapping;
        }
        log_config = cfg->log_config();
    }
    log_config.level = logging::level_from_verbosity(verbosity, log_config.level);
    log_config.printer = argv[1];
    if (log_to_file) {
        log_config.enable_file = true;
        log_config.file_path = log_file;
    }
    if (!logging::init(log_config)) {
        std::cerr << "Continuing without a log file\n";
    }

    connection.host = argv[1];
    connection.username = argv[2];
    connection.password = argv[3];
    if (!serial.empty()) {
        connection.serial = serial;
    }

    options.url = project_url(argv[4]);
    options.plate_id = plate_id;
    if (no_timelapse) {
        options.timelapse = false;
    }
    if (use_ams && options.ams_mapping.empty()) {
        options.ams_mapping = {0, 1, 2, 3};
    }

    PrintStateTracker tracker;
    DeviceClient client(connection);

    tracker.set_progress_callback([](const PrintProgress& progress) {
        std::cout << "State: " << progress.gcode_state << "  progress: " << progress.percent
                  << "%";
        if (progress.total_layers > 0) {
            std::cout << "  layer " << progress.layer << "/" << progress.total_layers;
        }
        std::cout << std::endl;
    });

    client.set_telemetry_handler([&client, &tracker](const json& frame) {
        PrintOutcome outcome = tracker.update(frame);
        if (outcome == PrintOutcome::IN_PROGRESS) {
            return;
        }
        if (outcome == PrintOutcome::FAILED) {
            std::cout << "PRINT ERROR, stopping print" << std::endl;
            DeviceError err = client.stop_no_reply();
            if (!err) {
                spdlog::error("[Turion Print] Unable to stop print: {}", err.message);
            }
        }
        // Done tracking
        client.set_telemetry_handler(nullptr);
    });

    std::cout << "Connecting to " << connection.host << std::endl;
    DeviceError err = client.connect();
    if (!err) {
        REPORT_FATAL("{}", err.user_message());
        spdlog::debug("[Turion Print] {} ({})", err.message, err.detail);
        return 1;
    }
    std::cout << "Connected to " << client.get_identity() << std::endl;

    std::cout << "Starting print of " << options.url << std::endl;
    json reply;
    err = client.print_project(options, reply);
    if (!err) {
        REPORT_FATAL("Print request failed: {}", err.user_message());
        client.disconnect();
        return 1;
    }

    const json print = reply.is_object() && reply.contains("print") ? reply["print"] : json();
    if (json_util::safe_string(print, "result") != "success") {
        std::string reason = json_util::safe_string(print, "reason", reply.dump());
        REPORT_FATAL("Printer refused the job: {}", reason);

        // Make sure nothing keeps running
        json stop_reply;
        DeviceError stop_err = client.stop(stop_reply);
        if (!stop_err) {
            spdlog::warn("[Turion Print] Stop after refused job failed: {}", stop_err.message);
        }
        client.disconnect();
        return 1;
    }
    std::cout << "Print successfully started" << std::endl;

    PrintOutcome outcome = tracker.wait_for_outcome();
    client.disconnect();

    if (outcome == PrintOutcome::FINISHED) {
        std::cout << "Print completed" << std::endl;
        return 0;
    }

    PrintProgress progress = tracker.get_progress();
    std::cerr << "Print failed (state " << progress.gcode_state << ", error 0x" << std::hex
              << progress.print_error << std::dec << ")\n";
    return 1;
}
