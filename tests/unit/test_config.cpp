// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <filesystem>
#include <fstream>
#include <random>

#include <catch2/catch_test_macros.hpp>

using namespace turion;
namespace fs = std::filesystem;

namespace turion {

/**
 * @brief Config backed by a file in a private temporary directory
 */
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("turion_config_test_" + std::to_string(rd()));
        fs::create_directories(dir);
        path = (dir / "config.json").string();
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write_file(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    json read_file() {
        std::ifstream in(path);
        return json::parse(in);
    }

    json& data() {
        return config.data;
    }

  protected:
    fs::path dir;
    std::string path;
    Config config;
};

} // namespace turion

// ============================================================================
// init
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "init creates a default config file", "[config]") {
    REQUIRE_FALSE(fs::exists(path));
    config.init(path);

    REQUIRE(fs::exists(path));
    CHECK(read_file() == Config::get_default_config());
    CHECK(config.get_path() == path);
    CHECK(config.get<int>("/device/port") == 8883);
}

TEST_CASE_METHOD(ConfigTestFixture, "init keeps user values and fills missing defaults",
                 "[config]") {
    write_file(R"({"device": {"host": "192.168.1.20", "password": "12345678"},
                   "custom": {"keep": true}})");
    config.init(path);

    CHECK(config.get<std::string>("/device/host") == "192.168.1.20");
    CHECK(config.get<std::string>("/device/username") == "bblp");
    CHECK(config.get<int>("/timeouts/reply_ms") == 10000);
    CHECK(config.get<bool>("/custom/keep") == true);

    // Merged document is written back
    json saved = read_file();
    CHECK(saved["device"]["port"] == 8883);
    CHECK(saved["device"]["host"] == "192.168.1.20");
}

TEST_CASE_METHOD(ConfigTestFixture, "init replaces a corrupt file and keeps a backup",
                 "[config]") {
    write_file("{ this is not json");
    config.init(path);

    CHECK(fs::exists(path + ".corrupt"));
    CHECK(read_file() == Config::get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "init treats a non-object document as corrupt", "[config]") {
    write_file("[1, 2, 3]");
    config.init(path);
    CHECK(data().is_object());
    CHECK(config.get<int>("/device/port") == 8883);
}

// ============================================================================
// get / set / save
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "get with default falls back on missing or mistyped values",
                 "[config]") {
    config.init(path);
    CHECK(config.get<std::string>("/nope/missing", "fallback") == "fallback");

    config.set<std::string>("/timeouts/reply_ms", "soon");
    CHECK(config.get<int>("/timeouts/reply_ms", 42) == 42);
}

TEST_CASE_METHOD(ConfigTestFixture, "set and save round-trip through the file", "[config]") {
    config.init(path);
    config.set<std::string>("/device/host", "printer.lan");
    config.set<int>("/timeouts/connect_ms", 45000);
    REQUIRE(config.save());
    CHECK_FALSE(fs::exists(path + ".tmp"));

    Config reloaded;
    reloaded.init(path);
    CHECK(reloaded.get<std::string>("/device/host") == "printer.lan");
    CHECK(reloaded.get<int>("/timeouts/connect_ms") == 45000);
}

TEST_CASE_METHOD(ConfigTestFixture, "reset_to_defaults discards changes", "[config]") {
    config.init(path);
    config.set<std::string>("/device/host", "printer.lan");
    config.reset_to_defaults();
    CHECK(config.get<std::string>("/device/host") == "");
}

// ============================================================================
// Typed views
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "device_connection_config reads device and timeouts",
                 "[config]") {
    write_file(R"({"device": {"host": "10.0.0.7", "port": 1883, "username": "u",
                              "password": "p", "serial": "SN1"},
                   "timeouts": {"connect_ms": 5000, "reply_ms": 700, "probe_ms": 300,
                                "reconnect_delay_ms": 2500}})");
    config.init(path);

    DeviceConnectionConfig c = config.device_connection_config();
    CHECK(c.host == "10.0.0.7");
    CHECK(c.port == 1883);
    CHECK(c.username == "u");
    CHECK(c.password == "p");
    CHECK(c.serial == "SN1");
    CHECK(c.connect_timeout_ms == 5000);
    CHECK(c.reply_timeout_ms == 700);
    CHECK(c.probe_timeout_ms == 300);
    CHECK(c.reconnect_delay_ms == 2500);
}

TEST_CASE_METHOD(ConfigTestFixture, "default_print_options reads the print section",
                 "[config]") {
    write_file(R"({"print": {"timelapse": false, "bed_type": "textured_plate",
                             "layer_inspect": false, "ams_mapping": [1, 0]}})");
    config.init(path);

    ProjectPrintOptions o = config.default_print_options();
    CHECK(o.url.empty());
    CHECK(o.timelapse == false);
    CHECK(o.bed_type == "textured_plate");
    CHECK(o.layer_inspect == false);
    CHECK(o.bed_levelling == true);
    CHECK(o.ams_mapping == std::vector<int>{1, 0});
}

TEST_CASE_METHOD(ConfigTestFixture, "log_config parses level and file", "[config]") {
    write_file(R"({"device": {"host": "192.168.1.20"},
                   "log": {"level": "debug", "to_file": true, "file": "/tmp/turion.log"}})");
    config.init(path);

    logging::LogConfig log = config.log_config();
    CHECK(log.level == spdlog::level::debug);
    CHECK(log.enable_file);
    CHECK(log.file_path == "/tmp/turion.log");
    CHECK(log.printer == "192.168.1.20");
}

TEST_CASE_METHOD(ConfigTestFixture, "log_config defaults to console only", "[config]") {
    write_file("{}");
    config.init(path);

    logging::LogConfig log = config.log_config();
    CHECK(log.level == spdlog::level::warn);
    CHECK_FALSE(log.enable_file);
    CHECK(log.enable_console);
}

TEST_CASE_METHOD(ConfigTestFixture, "log_config falls back to warn on unknown level",
                 "[config]") {
    write_file(R"({"log": {"level": "loud"}})");
    config.init(path);
    CHECK(config.log_config().level == spdlog::level::warn);
}
