// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "message_router.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

namespace turion {

MessageRouter::MessageRouter(SessionStateMachine& state, ReplyMailbox& mailbox)
    : state_(state), mailbox_(mailbox) {}

bool MessageRouter::is_telemetry(const json& msg) {
    if (!msg.is_object()) {
        return false;
    }
    auto print_it = msg.find("print");
    if (print_it == msg.end() || !print_it->is_object()) {
        return false;
    }
    auto cmd_it = print_it->find("command");
    return cmd_it != print_it->end() && cmd_it->is_string() &&
           cmd_it->get<std::string>() == "push_status";
}

json MessageRouter::decode(const std::string& payload, bool& malformed) {
    json msg = json::parse(payload, nullptr, false);
    if (msg.is_discarded()) {
        malformed = true;
        return json(payload);
    }
    malformed = false;
    return msg;
}

void MessageRouter::route(const std::string& payload) {
    spdlog::trace("[Message Router] Received: {}", payload);

    bool malformed = false;
    json msg = decode(payload, malformed);
    if (malformed) {
        spdlog::warn("[Message Router] Undecodable payload ({} bytes), routing as reply",
                     payload.size());
        emit_event(DeviceEventType::MALFORMED_PAYLOAD, "Inbound payload is not valid JSON", false,
                   payload.substr(0, 200));
    }

    if (is_telemetry(msg)) {
        if (state_.on_telemetry()) {
            spdlog::info("[Message Router] First telemetry frame received, session ready");
        }
        dispatch_telemetry(msg);
    } else {
        dispatch_reply(std::move(msg));
    }
}

void MessageRouter::dispatch_telemetry(const json& msg) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        telemetry_count_++;
    }

    std::lock_guard<std::recursive_mutex> lock(handler_mutex_);
    if (!handler_) {
        return;
    }

    // Invoke a copy: the handler may replace itself while running
    TelemetryHandler handler_copy = handler_;
    try {
        handler_copy(msg);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Message Router] Telemetry handler threw exception: {}", e.what());
        emit_event(DeviceEventType::HANDLER_FAILED, "Telemetry handler threw an exception", true,
                   e.what());
    }
}

void MessageRouter::dispatch_reply(json msg) {
    std::string pending = mailbox_.pending_command();
    std::string dump = msg.dump();

    if (mailbox_.deliver(std::move(msg))) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        reply_count_++;
        spdlog::debug("[Message Router] Delivered reply for '{}'", pending);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        unsolicited_count_++;
    }
    spdlog::warn("[Message Router] Dropping unsolicited reply: {}", dump.substr(0, 200));
    emit_event(DeviceEventType::UNSOLICITED_REPLY, "Reply received while no call was waiting",
               false, dump);
}

void MessageRouter::set_telemetry_handler(TelemetryHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
    spdlog::debug("[Message Router] Telemetry handler {}", handler_ ? "registered" : "cleared");
}

void MessageRouter::set_event_emitter(DeviceEventEmitter emitter) {
    std::lock_guard<std::mutex> lock(emitter_mutex_);
    emitter_ = std::move(emitter);
}

void MessageRouter::emit_event(DeviceEventType type, const std::string& message, bool is_error,
                               const std::string& details) {
    DeviceEventEmitter emitter_copy;
    {
        std::lock_guard<std::mutex> lock(emitter_mutex_);
        emitter_copy = emitter_;
    }
    if (emitter_copy) {
        emitter_copy(type, message, is_error, details);
    }
}

} // namespace turion
