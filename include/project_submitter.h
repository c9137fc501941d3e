// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_client.h"
#include "job_settings.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Stores a file on the printer's storage
 *
 * Implemented by the caller (FTPS on real hardware).
 */
class FileTransfer {
  public:
    virtual ~FileTransfer() = default;

    /**
     * @brief Create directory if needed and store contents as directory/file_name,
     *        replacing an existing file
     *
     * @return false on any failure
     */
    virtual bool upload(const std::string& directory, const std::string& file_name,
                        const std::string& contents) = 0;
};

struct UploadedFile {
    std::string file_name;
    std::string contents;
};

/**
 * @brief One OctoPrint-style upload request
 */
struct SubmitRequest {
    std::string command = "select"; ///< Only "select" is supported
    bool start_print = false;       ///< Start printing after the upload
    std::string path;               ///< Target directory on the printer's storage
    std::optional<UploadedFile> file;
};

/**
 * @brief Outcome, expressed as the HTTP status a front-end should answer with
 */
struct SubmitResult {
    int status = 204;
    std::string message;
    json reply; ///< Printer reply when a print was started
};

/**
 * @brief Upload a project and optionally start it
 *
 * Statuses: 400 no file, 503 unsupported command or not a .3mf, 502 upload
 * failed, 419 the printer refused or never answered the print request, 204
 * success.
 */
class ProjectSubmitter {
  public:
    using ClientFactory =
        std::function<std::unique_ptr<DeviceClient>(const DeviceConnectionConfig&)>;

    /**
     * @param transfer Upload channel, not owned
     * @param defaults Timeouts and ports applied to every job
     * @param factory Creates the client for a job; a production DeviceClient when empty
     */
    ProjectSubmitter(FileTransfer& transfer, DeviceConnectionConfig defaults = {},
                     ClientFactory factory = nullptr);

    SubmitResult submit(const JobSettings& settings, const SubmitRequest& request);

    /// Storage URI of an uploaded file, e.g. file:///sdcard/jobs/part.3mf
    static std::string storage_uri(const std::string& path, const std::string& file_name);

    /// Task name shown on the printer
    static std::string task_name(const std::string& file_name);

    /// OctoPrint-compatible /api/version document
    static json version_info();

  private:
    SubmitResult start_print(const JobSettings& settings, const std::string& uri,
                             const std::string& file_name);

    FileTransfer& transfer_;
    DeviceConnectionConfig defaults_;
    ClientFactory factory_;
};

} // namespace turion
