// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "project_submitter.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

namespace turion {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

SubmitResult make_result(int status, const std::string& message) {
    SubmitResult result;
    result.status = status;
    result.message = message;
    return result;
}

} // namespace

ProjectSubmitter::ProjectSubmitter(FileTransfer& transfer, DeviceConnectionConfig defaults,
                                   ClientFactory factory)
    : transfer_(transfer), defaults_(std::move(defaults)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const DeviceConnectionConfig& config) {
            return std::make_unique<DeviceClient>(config);
        };
    }
}

std::string ProjectSubmitter::storage_uri(const std::string& path, const std::string& file_name) {
    std::string dir = path;
    while (!dir.empty() && dir.back() == '/') {
        dir.pop_back();
    }
    if (dir.empty()) {
        return "file:///sdcard/" + file_name;
    }
    if (dir.front() == '/') {
        return "file:///sdcard" + dir + "/" + file_name;
    }
    return "file:///sdcard/" + dir + "/" + file_name;
}

std::string ProjectSubmitter::task_name(const std::string& file_name) {
    return file_name + " (via TurionLink)";
}

json ProjectSubmitter::version_info() {
    // Slicers only accept hosts whose text starts with "OctoPrint"
    return {{"api", "0.1"},
            {"server", "1.3.10"},
            {"text", "OctoPrint Compatible Turion Link 0.0.1"}};
}

SubmitResult ProjectSubmitter::submit(const JobSettings& settings, const SubmitRequest& request) {
    if (request.command != "select") {
        spdlog::warn("[Project Submitter] Unsupported command '{}'", request.command);
        return make_result(503, "unsupported command");
    }
    if (!request.file) {
        return make_result(400, "no file in request");
    }

    const std::string file_name = DeviceCommandBuilder::base_name(request.file->file_name);
    if (file_name.empty()) {
        return make_result(400, "empty file name");
    }
    // Only projects with embedded G-code are printable
    if (!ends_with(file_name, ".3mf")) {
        spdlog::warn("[Project Submitter] Rejecting '{}': not a .3mf project", file_name);
        return make_result(503, "only .3mf projects are supported");
    }

    const std::string uri = storage_uri(request.path, file_name);
    spdlog::info("[Project Submitter] Uploading {} ({} bytes)", uri, request.file->contents.size());
    if (!transfer_.upload(request.path, file_name, request.file->contents)) {
        spdlog::error("[Project Submitter] Upload of {} failed", uri);
        return make_result(502, "upload failed");
    }
    spdlog::info("[Project Submitter] Uploaded {}", uri);

    if (!request.start_print) {
        return make_result(204, "uploaded");
    }
    return start_print(settings, uri, file_name);
}

SubmitResult ProjectSubmitter::start_print(const JobSettings& settings, const std::string& uri,
                                           const std::string& file_name) {
    std::unique_ptr<DeviceClient> client = factory_(settings.connection_config(defaults_));

    DeviceError err = client->connect();
    if (!err) {
        spdlog::error("[Project Submitter] {}", err.message);
        return make_result(419, err.user_message());
    }

    json reply;
    err = client->print_project(settings.project_options(uri, task_name(file_name)), reply);
    client->disconnect();

    if (!err) {
        spdlog::error("[Project Submitter] print_project failed: {}", err.message);
        return make_result(419, err.user_message());
    }

    const json print = reply.is_object() && reply.contains("print") ? reply["print"] : json();
    if (json_util::safe_string(print, "result") != "success") {
        std::string reason = json_util::safe_string(print, "reason", "printer refused the job");
        spdlog::error("[Project Submitter] Printer refused {}: {}", uri, reason);
        SubmitResult result = make_result(419, reason);
        result.reply = reply;
        return result;
    }

    spdlog::info("[Project Submitter] Print of {} started", uri);
    SubmitResult result = make_result(204, "print started");
    result.reply = reply;
    return result;
}

} // namespace turion
