// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace turion {

/**
 * @brief Event types emitted by the device session
 *
 * Transport-level conditions that do not fail a caller directly are surfaced
 * through these events instead.
 */
enum class DeviceEventType {
    CONNECTION_LOST,   ///< MQTT connection closed while the session was active
    RECONNECTING,      ///< Waiting for the automatic reconnect
    RECONNECTED,       ///< Transport connected again after a drop
    UNSOLICITED_REPLY, ///< Reply arrived while no call was waiting for one
    MALFORMED_PAYLOAD, ///< Inbound payload was not valid JSON
    REPLY_TIMEOUT,     ///< A reply-awaiting call gave up
    HANDLER_FAILED     ///< Telemetry handler threw
};

/**
 * @brief Event structure passed to event handlers
 */
struct DeviceEvent {
    DeviceEventType type;
    std::string message; ///< Human-readable message
    std::string details; ///< Additional details (optional)
    bool is_error;       ///< true for errors, false for warnings/info
};

/**
 * @brief Callback type for event handlers
 */
using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

/**
 * @brief Emitter signature shared by the session components
 */
using DeviceEventEmitter =
    std::function<void(DeviceEventType, const std::string&, bool, const std::string&)>;

inline const char* device_event_name(DeviceEventType type) {
    switch (type) {
    case DeviceEventType::CONNECTION_LOST:
        return "CONNECTION_LOST";
    case DeviceEventType::RECONNECTING:
        return "RECONNECTING";
    case DeviceEventType::RECONNECTED:
        return "RECONNECTED";
    case DeviceEventType::UNSOLICITED_REPLY:
        return "UNSOLICITED_REPLY";
    case DeviceEventType::MALFORMED_PAYLOAD:
        return "MALFORMED_PAYLOAD";
    case DeviceEventType::REPLY_TIMEOUT:
        return "REPLY_TIMEOUT";
    case DeviceEventType::HANDLER_FAILED:
        return "HANDLER_FAILED";
    }
    return "UNKNOWN";
}

} // namespace turion
