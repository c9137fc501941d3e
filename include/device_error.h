// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace turion {

/**
 * @brief Error categories for printer device operations
 */
enum class DeviceErrorType {
    NONE,             // No error
    IDENTITY,         // Identity probe failed (handshake failure or no CN in certificate)
    CONNECT,          // Transport connect failed or first telemetry never arrived
    PUBLISH,          // Transport refused outbound data
    REPLY_TIMEOUT,    // No reply observed within the reply timeout
    BUSY,             // Another reply-awaiting call is already in flight
    CANCELLED,        // Wait aborted by disconnect()
    CONNECTION_LOST,  // Transport dropped while a call was waiting
    NOT_CONNECTED,    // Operation requires an established session
    INVALID_ARGUMENT, // Caller supplied unusable input
    UNKNOWN           // Unknown error
};

/**
 * @brief Result of a synchronous device operation
 *
 * Default-constructed value means success. Converts to true on success so
 * call sites can write `if (auto err = client.stop(reply); !err) { ... }`.
 */
struct DeviceError {
    DeviceErrorType type = DeviceErrorType::NONE;
    int code = 0;        // Transport or TLS error code if applicable
    std::string message; // Human-readable error message
    std::string detail;  // Operation or endpoint that caused the error

    bool has_error() const {
        return type != DeviceErrorType::NONE;
    }

    explicit operator bool() const {
        return !has_error();
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        switch (type) {
        case DeviceErrorType::NONE:
            return "NONE";
        case DeviceErrorType::IDENTITY:
            return "IDENTITY";
        case DeviceErrorType::CONNECT:
            return "CONNECT";
        case DeviceErrorType::PUBLISH:
            return "PUBLISH";
        case DeviceErrorType::REPLY_TIMEOUT:
            return "REPLY_TIMEOUT";
        case DeviceErrorType::BUSY:
            return "BUSY";
        case DeviceErrorType::CANCELLED:
            return "CANCELLED";
        case DeviceErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case DeviceErrorType::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case DeviceErrorType::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case DeviceErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        switch (type) {
        case DeviceErrorType::IDENTITY:
            return "Unable to read the printer serial number from its certificate.";
        case DeviceErrorType::CONNECT:
            return "Unable to connect to the printer. Check the access code and network.";
        case DeviceErrorType::REPLY_TIMEOUT:
            return "The printer did not answer in time.";
        case DeviceErrorType::BUSY:
            return "Another command is still waiting for the printer.";
        case DeviceErrorType::CONNECTION_LOST:
            return "Connection to printer lost.";
        default:
            break;
        }
        if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static DeviceError success() {
        return DeviceError{};
    }

    static DeviceError identity_failed(const std::string& what, const std::string& endpoint,
                                       int code = 0) {
        DeviceError err;
        err.type = DeviceErrorType::IDENTITY;
        err.code = code;
        err.message = "Identity probe failed: " + what;
        err.detail = endpoint;
        return err;
    }

    static DeviceError connect_failed(const std::string& what, const std::string& endpoint,
                                      int code = 0) {
        DeviceError err;
        err.type = DeviceErrorType::CONNECT;
        err.code = code;
        err.message = "Connect failed: " + what;
        err.detail = endpoint;
        return err;
    }

    static DeviceError connect_timeout(const std::string& endpoint, uint32_t timeout_ms) {
        DeviceError err;
        err.type = DeviceErrorType::CONNECT;
        err.message = "No telemetry from printer after " + std::to_string(timeout_ms) + "ms";
        err.detail = endpoint;
        return err;
    }

    static DeviceError publish_failed(const std::string& topic, int code) {
        DeviceError err;
        err.type = DeviceErrorType::PUBLISH;
        err.code = code;
        err.message = "Transport refused publish (code " + std::to_string(code) + ")";
        err.detail = topic;
        return err;
    }

    static DeviceError reply_timeout(const std::string& command, uint32_t timeout_ms) {
        DeviceError err;
        err.type = DeviceErrorType::REPLY_TIMEOUT;
        err.message = "No reply after " + std::to_string(timeout_ms) + "ms";
        err.detail = command;
        return err;
    }

    static DeviceError busy(const std::string& command = "") {
        DeviceError err;
        err.type = DeviceErrorType::BUSY;
        err.message = "A reply is already pending";
        err.detail = command;
        return err;
    }

    static DeviceError cancelled(const std::string& command = "") {
        DeviceError err;
        err.type = DeviceErrorType::CANCELLED;
        err.message = "Wait cancelled by disconnect";
        err.detail = command;
        return err;
    }

    static DeviceError connection_lost(const std::string& command = "") {
        DeviceError err;
        err.type = DeviceErrorType::CONNECTION_LOST;
        err.message = "MQTT connection lost";
        err.detail = command;
        return err;
    }

    static DeviceError not_connected(const std::string& command = "") {
        DeviceError err;
        err.type = DeviceErrorType::NOT_CONNECTED;
        err.message = "Session is not connected";
        err.detail = command;
        return err;
    }

    static DeviceError invalid_argument(const std::string& what) {
        DeviceError err;
        err.type = DeviceErrorType::INVALID_ARGUMENT;
        err.message = what;
        return err;
    }
};

} // namespace turion
