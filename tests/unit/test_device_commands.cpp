// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_commands.h"

#include <set>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace turion;

// ============================================================================
// SequenceCounter
// ============================================================================

TEST_CASE("SequenceCounter starts at zero and increments", "[device_commands]") {
    SequenceCounter seq;
    CHECK(seq.peek() == 0);
    CHECK(seq.next() == 0);
    CHECK(seq.next() == 1);
    CHECK(seq.peek() == 2);
    seq.reset();
    CHECK(seq.next() == 0);
}

TEST_CASE("SequenceCounter hands out unique ids across threads", "[device_commands]") {
    SequenceCounter seq;
    std::vector<std::vector<uint64_t>> taken(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < taken.size(); t++) {
        threads.emplace_back([&seq, &taken, t]() {
            for (int i = 0; i < 250; i++) {
                taken[t].push_back(seq.next());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<uint64_t> all;
    for (const auto& ids : taken) {
        all.insert(ids.begin(), ids.end());
    }
    CHECK(all.size() == 1000);
    CHECK(*all.rbegin() == 999);
}

// ============================================================================
// Simple commands
// ============================================================================

TEST_CASE("stop, pause and resume documents", "[device_commands]") {
    json stop = DeviceCommandBuilder::stop(3);
    CHECK(stop == json::parse(R"({"print":{"sequence_id":"3","command":"stop","param":""}})"));

    CHECK(DeviceCommandBuilder::pause(4)["print"]["command"] == "pause");
    CHECK(DeviceCommandBuilder::resume(5)["print"]["command"] == "resume");
    CHECK(DeviceCommandBuilder::resume(5)["print"]["sequence_id"] == "5");
}

TEST_CASE("gcode_line carries the G-code and user id", "[device_commands]") {
    json msg = DeviceCommandBuilder::gcode_line(0, "G28\nM104 S200");
    const json& print = msg["print"];
    CHECK(print["command"] == "gcode_line");
    CHECK(print["param"] == "G28\nM104 S200");
    CHECK(print["sequence_id"] == "0");
    CHECK(print["user_id"] == "0");
}

TEST_CASE("gcode_file carries the url", "[device_commands]") {
    json msg = DeviceCommandBuilder::gcode_file(9, "file:///sdcard/cube.gcode");
    CHECK(msg["print"]["command"] == "gcode_file");
    CHECK(msg["print"]["param"] == "file:///sdcard/cube.gcode");
}

TEST_CASE("push_all asks for a complete status report", "[device_commands]") {
    json msg = DeviceCommandBuilder::push_all(1);
    CHECK(msg["pushing"]["command"] == "pushall");
    CHECK(msg["pushing"]["version"] == 1);
    CHECK(msg["pushing"]["push_target"] == 1);
    CHECK(msg["pushing"]["sequence_id"] == "1");
}

// ============================================================================
// project_file
// ============================================================================

TEST_CASE("project_file with defaults", "[device_commands]") {
    ProjectPrintOptions options;
    options.url = "file:///sdcard/jobs/part.3mf";

    json msg = DeviceCommandBuilder::project_file(7, options);
    const json& print = msg["print"];

    CHECK(print["command"] == "project_file");
    CHECK(print["sequence_id"] == "7");
    CHECK(print["param"] == "Metadata/plate_1.gcode");
    CHECK(print["url"] == "file:///sdcard/jobs/part.3mf");
    CHECK(print["subtask_name"] == "part.3mf");
    CHECK(print["project_id"] == "0");
    CHECK(print["profile_id"] == "0");
    CHECK(print["task_id"] == "0");
    CHECK(print["subtask_id"] == "0");
    CHECK(print["file"] == "");
    CHECK(print["md5"] == "");
    CHECK(print["timelapse"] == true);
    CHECK(print["bed_type"] == "auto");
    CHECK(print["bed_levelling"] == true);
    CHECK(print["flow_cali"] == true);
    CHECK(print["vibration_cali"] == true);
    CHECK(print["layer_inspect"] == true);
    CHECK(print["ams_mapping"] == json::array());
    CHECK(print["use_ams"] == false);
}

TEST_CASE("project_file with plate, AMS mapping and task name", "[device_commands]") {
    ProjectPrintOptions options;
    options.url = "ftp://printer/part.3mf";
    options.plate_id = 2;
    options.ams_mapping = {0, 2, -1};
    options.task_name = std::string("part.3mf (via TurionLink)");
    options.timelapse = false;
    options.bed_type = "textured_plate";
    options.flow_calibration = false;

    const json print = DeviceCommandBuilder::project_file(0, options)["print"];

    CHECK(print["param"] == "Metadata/plate_2.gcode");
    CHECK(print["ams_mapping"] == json::array({0, 2, -1}));
    CHECK(print["use_ams"] == true);
    CHECK(print["subtask_name"] == "part.3mf (via TurionLink)");
    CHECK(print["timelapse"] == false);
    CHECK(print["bed_type"] == "textured_plate");
    CHECK(print["flow_cali"] == false);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("base_name takes the text after the last slash", "[device_commands]") {
    CHECK(DeviceCommandBuilder::base_name("file:///sdcard/a/b.3mf") == "b.3mf");
    CHECK(DeviceCommandBuilder::base_name("b.3mf") == "b.3mf");
    CHECK(DeviceCommandBuilder::base_name("dir/") == "");
    CHECK(DeviceCommandBuilder::base_name("") == "");
}

TEST_CASE("base_name keeps query-like suffixes", "[device_commands]") {
    CHECK(DeviceCommandBuilder::base_name("http://h/d/part.3mf?token=a") == "part.3mf?token=a");
    CHECK(DeviceCommandBuilder::base_name("part.3mf?x=1/2") == "2");
    CHECK(DeviceCommandBuilder::base_name("ftp://printer/cache/a b.3mf#frag") == "a b.3mf#frag");
}

TEST_CASE("project_file names the task after the url when no name is given",
          "[device_commands]") {
    ProjectPrintOptions options;
    options.url = "http://h/d/part.3mf?token=a";
    options.plate_id = 1;

    SECTION("unset") {
        CHECK(DeviceCommandBuilder::project_file(0, options)["print"]["subtask_name"] ==
              "part.3mf?token=a");
    }

    SECTION("empty counts as unset") {
        options.task_name = std::string();
        CHECK(DeviceCommandBuilder::project_file(0, options)["print"]["subtask_name"] ==
              "part.3mf?token=a");
    }

    CHECK(DeviceCommandBuilder::project_file(0, options)["print"]["url"] ==
          "http://h/d/part.3mf?token=a");
}

TEST_CASE("command_name finds the command in any group", "[device_commands]") {
    CHECK(DeviceCommandBuilder::command_name(DeviceCommandBuilder::stop(0)) == "stop");
    CHECK(DeviceCommandBuilder::command_name(DeviceCommandBuilder::push_all(0)) == "pushall");
    CHECK(DeviceCommandBuilder::command_name(json{{"info", {{"command", "get_version"}}}}) ==
          "get_version");
    CHECK(DeviceCommandBuilder::command_name(json{{"print", {{"result", "x"}}}}) == "");
    CHECK(DeviceCommandBuilder::command_name(json("raw")) == "");
}
