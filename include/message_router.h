// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_events.h"
#include "reply_mailbox.h"
#include "session_state.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Telemetry handler
 *
 * Invoked synchronously on the delivery thread for every push_status frame.
 * Any user context is captured by the closure.
 */
using TelemetryHandler = std::function<void(const json&)>;

/**
 * @brief Classifies inbound payloads and dispatches them
 *
 * Every inbound message is either telemetry (top-level print.command equals
 * "push_status") or a reply. Telemetry goes to the registered handler, replies
 * go to the single-slot ReplyMailbox. The first telemetry frame after a
 * transport connect completes the session.
 *
 * route() runs on the transport's delivery thread only.
 */
class MessageRouter {
  public:
    MessageRouter(SessionStateMachine& state, ReplyMailbox& mailbox);

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    /**
     * @brief Decode, classify and dispatch one inbound payload
     *
     * Undecodable payloads are treated as replies carrying the raw text as a
     * JSON string.
     */
    void route(const std::string& payload);

    /**
     * @brief Replace the telemetry handler (nullptr clears it)
     *
     * Waits for an in-flight invocation of the previous handler to return
     * unless called from inside that handler.
     */
    void set_telemetry_handler(TelemetryHandler handler);

    void set_event_emitter(DeviceEventEmitter emitter);

    /// True iff the document is a push_status frame
    static bool is_telemetry(const json& msg);

    /**
     * @brief Parse a payload without throwing
     *
     * @param malformed Set to true when the payload was not valid JSON
     * @return Parsed document, or a JSON string holding the raw payload
     */
    static json decode(const std::string& payload, bool& malformed);

    uint64_t telemetry_count() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return telemetry_count_;
    }

    uint64_t reply_count() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return reply_count_;
    }

    uint64_t unsolicited_count() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return unsolicited_count_;
    }

  private:
    void dispatch_telemetry(const json& msg);
    void dispatch_reply(json msg);
    void emit_event(DeviceEventType type, const std::string& message, bool is_error = false,
                    const std::string& details = "");

    SessionStateMachine& state_;
    ReplyMailbox& mailbox_;

    // Held for the whole handler invocation. Recursive so the handler can
    // replace itself without deadlocking the delivery thread.
    std::recursive_mutex handler_mutex_;
    TelemetryHandler handler_;

    std::mutex emitter_mutex_;
    DeviceEventEmitter emitter_;

    mutable std::mutex stats_mutex_;
    uint64_t telemetry_count_{0};
    uint64_t reply_count_{0};
    uint64_t unsolicited_count_{0};
};

} // namespace turion
