// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace turion {
namespace logging {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : "";
}

std::string state_dir() {
    std::string xdg = env_or_empty("XDG_STATE_HOME");
    if (!xdg.empty()) {
        return xdg;
    }
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return home + "/.local/state";
    }
    return "/tmp";
}

/// Printer names end up in file names; keep them to a safe character set
std::string file_stem(const std::string& printer) {
    if (printer.empty()) {
        return "turion-link";
    }
    std::string stem = printer;
    std::replace_if(
        stem.begin(), stem.end(),
        [](char c) {
            return !(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.');
        },
        '_');
    return stem;
}

} // namespace

std::string default_log_path(const std::string& printer) {
    return state_dir() + "/turion-link/" + file_stem(printer) + ".log";
}

bool init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    bool file_ok = true;

    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%^%-5l%$ %v");
        sinks.push_back(console);
    }

    std::string path;
    if (config.enable_file) {
        path = config.file_path.empty() ? default_log_path(config.printer) : config.file_path;
        try {
            std::error_code ec;
            std::filesystem::path parent = std::filesystem::path(path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent, ec);
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            fprintf(stderr, "turion-link: unable to open log file %s: %s\n", path.c_str(),
                    e.what());
            file_ok = false;
        }
    }

    const std::string name = config.printer.empty() ? "turion" : config.printer;
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    // A failed print usually ends the process right after the error
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: console={}, file={}, level={}",
                  config.enable_console ? "yes" : "no", path.empty() ? "none" : path,
                  spdlog::level::to_string_view(config.level));
    return file_ok;
}

spdlog::level::level_enum level_from_verbosity(int verbosity, spdlog::level::level_enum base) {
    int level = static_cast<int>(base) - std::max(verbosity, 0);
    return static_cast<spdlog::level::level_enum>(
        std::max(level, static_cast<int>(spdlog::level::trace)));
}

} // namespace logging
} // namespace turion
