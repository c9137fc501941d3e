// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "project_submitter.h"

#include "../mocks/mock_device_transport.h"

#include <mutex>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace turion;

namespace {

class MockFileTransfer : public FileTransfer {
  public:
    struct Upload {
        std::string directory;
        std::string file_name;
        std::string contents;
    };

    bool upload(const std::string& directory, const std::string& file_name,
                const std::string& contents) override {
        uploads.push_back({directory, file_name, contents});
        return succeed;
    }

    bool succeed = true;
    std::vector<Upload> uploads;
};

} // namespace

/**
 * @brief Submitter whose clients talk to a simulated printer
 *
 * The printer answers project_file with `printer_reply` unless
 * `printer_answers` is false. Published commands are captured across clients.
 */
class ProjectSubmitterTestFixture {
  public:
    ProjectSubmitterTestFixture() {
        defaults.connect_timeout_ms = 1000;
        defaults.reply_timeout_ms = 200;
        settings = *parse_job_settings("host=192.168.1.20;pass=12345678;ams_mapping=0,1");
    }

    ProjectSubmitter make_submitter() {
        return ProjectSubmitter(transfer, defaults, [this](const DeviceConnectionConfig& config) {
            last_config = config;
            auto mock = std::make_unique<MockDeviceTransport>();
            mock->set_send_telemetry_on_connect(printer_online);
            if (printer_answers) {
                mock->set_reply("project_file", printer_reply);
            }
            mock->set_publish_hook([this](const json& msg) {
                std::lock_guard<std::mutex> lock(sent_mutex);
                sent.push_back(msg);
            });
            auto client = std::make_unique<DeviceClient>(config, std::move(mock));
            client->set_identity("01P00A391800123");
            return client;
        });
    }

    static SubmitRequest request(const std::string& file_name, bool start_print,
                                 const std::string& path = "") {
        SubmitRequest req;
        req.start_print = start_print;
        req.path = path;
        req.file = UploadedFile{file_name, "PK\x03\x04 project"};
        return req;
    }

    std::vector<json> published() {
        std::lock_guard<std::mutex> lock(sent_mutex);
        return sent;
    }

  protected:
    MockFileTransfer transfer;
    DeviceConnectionConfig defaults;
    DeviceConnectionConfig last_config;
    JobSettings settings;

    bool printer_online = true;
    bool printer_answers = true;
    json printer_reply = {{"print", {{"command", "project_file"}, {"result", "success"}}}};

    std::mutex sent_mutex;
    std::vector<json> sent;
};

// ============================================================================
// Request validation
// ============================================================================

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Only the select command is supported",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    SubmitRequest req = request("part.3mf", false);
    req.command = "slice";
    CHECK(submitter.submit(settings, req).status == 503);
    CHECK(transfer.uploads.empty());
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Request without file is rejected",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    SubmitRequest req;
    CHECK(submitter.submit(settings, req).status == 400);

    req.file = UploadedFile{"jobs/", "data"};
    CHECK(submitter.submit(settings, req).status == 400);
    CHECK(transfer.uploads.empty());
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Plain G-code uploads are refused",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    CHECK(submitter.submit(settings, request("part.gcode", true)).status == 503);
    CHECK(submitter.submit(settings, request("part.3mf.bak", true)).status == 503);
    CHECK(transfer.uploads.empty());
}

// ============================================================================
// Upload
// ============================================================================

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Upload without print returns 204",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    SubmitResult result = submitter.submit(settings, request("part.3mf", false, "jobs"));

    CHECK(result.status == 204);
    REQUIRE(transfer.uploads.size() == 1);
    CHECK(transfer.uploads[0].directory == "jobs");
    CHECK(transfer.uploads[0].file_name == "part.3mf");
    CHECK(transfer.uploads[0].contents == "PK\x03\x04 project");
    CHECK(published().empty());
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Upload keeps only the base name of the file",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    submitter.submit(settings, request("C:/slicer/out/part.3mf", false));
    REQUIRE(transfer.uploads.size() == 1);
    CHECK(transfer.uploads[0].file_name == "part.3mf");
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Failed upload returns 502", "[project_submitter]") {
    transfer.succeed = false;
    ProjectSubmitter submitter = make_submitter();
    CHECK(submitter.submit(settings, request("part.3mf", true)).status == 502);
    CHECK(published().empty());
}

// ============================================================================
// Starting the print
// ============================================================================

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Upload and print starts the project",
                 "[project_submitter]") {
    ProjectSubmitter submitter = make_submitter();
    SubmitResult result = submitter.submit(settings, request("part.3mf", true, "/jobs"));

    CHECK(result.status == 204);
    CHECK(result.reply == printer_reply);

    CHECK(last_config.host == "192.168.1.20");
    CHECK(last_config.password == "12345678");
    CHECK(last_config.reply_timeout_ms == 200);

    auto msgs = published();
    REQUIRE(msgs.size() == 1);
    const json& print = msgs[0]["print"];
    CHECK(print["command"] == "project_file");
    CHECK(print["url"] == "file:///sdcard/jobs/part.3mf");
    CHECK(print["subtask_name"] == "part.3mf (via TurionLink)");
    CHECK(print["ams_mapping"] == json::array({0, 1}));
    CHECK(print["use_ams"] == true);
    CHECK(print["timelapse"] == false);
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Printer refusal returns 419 with the reason",
                 "[project_submitter]") {
    printer_reply = {{"print", {{"result", "failed"}, {"reason", "SD card not present"}}}};
    ProjectSubmitter submitter = make_submitter();

    SubmitResult result = submitter.submit(settings, request("part.3mf", true));
    CHECK(result.status == 419);
    CHECK(result.message == "SD card not present");
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Missing printer reply returns 419",
                 "[project_submitter]") {
    printer_answers = false;
    ProjectSubmitter submitter = make_submitter();
    CHECK(submitter.submit(settings, request("part.3mf", true)).status == 419);
}

TEST_CASE_METHOD(ProjectSubmitterTestFixture, "Unreachable printer returns 419",
                 "[project_submitter]") {
    printer_online = false;
    ProjectSubmitter submitter = make_submitter();
    CHECK(submitter.submit(settings, request("part.3mf", true)).status == 419);
    // The file is on the printer even though the print never started
    CHECK(transfer.uploads.size() == 1);
    CHECK(published().empty());
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("storage_uri normalises the directory", "[project_submitter]") {
    CHECK(ProjectSubmitter::storage_uri("", "a.3mf") == "file:///sdcard/a.3mf");
    CHECK(ProjectSubmitter::storage_uri("/", "a.3mf") == "file:///sdcard/a.3mf");
    CHECK(ProjectSubmitter::storage_uri("jobs", "a.3mf") == "file:///sdcard/jobs/a.3mf");
    CHECK(ProjectSubmitter::storage_uri("/jobs/", "a.3mf") == "file:///sdcard/jobs/a.3mf");
    CHECK(ProjectSubmitter::storage_uri("x/y", "a.3mf") == "file:///sdcard/x/y/a.3mf");
}

TEST_CASE("version_info identifies as OctoPrint compatible", "[project_submitter]") {
    json info = ProjectSubmitter::version_info();
    CHECK(info["api"] == "0.1");
    CHECK(info["server"] == "1.3.10");
    CHECK(info["text"].get<std::string>().rfind("OctoPrint", 0) == 0);
}
