// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_client.h"

#include "device_identity.h"
#include "error_reporting.h"
#include "mqtt_transport.h"

#include <spdlog/spdlog.h>

namespace turion {

DeviceClient::DeviceClient(DeviceConnectionConfig config,
                           std::unique_ptr<DeviceTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)), identity_(config_.serial),
      router_(state_, mailbox_) {
    if (!transport_) {
        transport_ = std::make_unique<MqttTransport>();
    }

    router_.set_event_emitter([this](DeviceEventType type, const std::string& message,
                                     bool is_error, const std::string& details) {
        emit_event(type, message, is_error, details);
    });

    spdlog::debug("[Device Client] Created for {}:{}", config_.host, config_.port);
}

DeviceClient::~DeviceClient() {
    disconnect();
    // Join the delivery thread while the router and mailbox it calls into still exist
    transport_.reset();
}

DeviceError DeviceClient::resolve_identity() {
    {
        std::lock_guard<std::mutex> lock(identity_mutex_);
        if (!identity_.empty()) {
            return DeviceError::success();
        }
    }

    std::string probed;
    DeviceError err =
        probe_device_identity(config_.host, config_.port, config_.probe_timeout_ms, probed);
    if (!err) {
        return err;
    }

    std::lock_guard<std::mutex> lock(identity_mutex_);
    identity_ = probed;
    return DeviceError::success();
}

void DeviceClient::set_identity(const std::string& identity) {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    identity_ = identity;
}

std::string DeviceClient::get_identity() const {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    return identity_;
}

std::string DeviceClient::report_topic() const {
    return "device/" + get_identity() + "/report";
}

std::string DeviceClient::request_topic() const {
    return "device/" + get_identity() + "/request";
}

TransportOptions DeviceClient::transport_options() const {
    TransportOptions options;
    options.host = config_.host;
    options.port = config_.port;
    options.username = config_.username;
    options.password = config_.password;
    options.client_id = config_.client_id;
    options.sni_host = get_identity();
    options.connect_timeout_ms = config_.connect_timeout_ms;
    options.reconnect_delay_ms = config_.reconnect_delay_ms;
    options.keepalive_s = config_.keepalive_s;
    options.use_tls = config_.use_tls;
    return options;
}

DeviceError DeviceClient::connect() {
    const std::string endpoint = config_.host + ":" + std::to_string(config_.port);

    uint64_t session = 0;
    if (!state_.begin_connect(&session)) {
        if (state_.get_state() == SessionState::READY) {
            spdlog::debug("[Device Client] Already connected to {}", endpoint);
            return DeviceError::success();
        }
        spdlog::warn("[Device Client] connect() while another connect is in progress");
        return DeviceError::busy("connect");
    }

    DeviceError err = resolve_identity();
    if (!err) {
        state_.reset_session(session);
        return err;
    }
    if (!state_.is_current(session)) {
        spdlog::info("[Device Client] Connect to {} cancelled before opening", endpoint);
        return DeviceError::cancelled("connect");
    }

    spdlog::info("[Device Client] Connecting to {} as '{}'", endpoint, get_identity());
    reconnecting_.store(false);

    TransportCallbacks callbacks;
    callbacks.on_connected = [this]() { handle_transport_connected(); };
    callbacks.on_closed = [this]() { handle_transport_closed(); };
    callbacks.on_message = [this](const std::string& topic, const std::string& payload) {
        handle_transport_message(topic, payload);
    };

    err = transport_->open(transport_options(), std::move(callbacks));
    if (!err) {
        spdlog::error("[Device Client] {}", err.message);
        state_.reset_session(session);
        transport_->close();
        return err;
    }

    if (!state_.wait_until_ready(config_.connect_timeout_ms, session)) {
        if (!state_.reset_session(session)) {
            // disconnect() ran while opening or waiting. Its close() may have
            // come before open() finished, so close again unless a newer
            // session has started on this transport.
            if (!state_.is_active()) {
                transport_->close();
            }
            spdlog::info("[Device Client] Connect to {} cancelled", endpoint);
            return DeviceError::cancelled("connect");
        }
        spdlog::error("[Device Client] No telemetry from {} after {}ms", endpoint,
                      config_.connect_timeout_ms);
        transport_->close();
        return DeviceError::connect_timeout(endpoint, config_.connect_timeout_ms);
    }

    spdlog::info("[Device Client] Connected to {}", endpoint);
    return DeviceError::success();
}

void DeviceClient::disconnect() {
    SessionState old_state = state_.get_state();

    // State first so a late on_closed is not mistaken for a connection drop
    state_.reset();
    mailbox_.cancel(DeviceError::cancelled(mailbox_.pending_command()));
    transport_->close();
    reconnecting_.store(false);

    if (old_state != SessionState::DISCONNECTED) {
        spdlog::info("[Device Client] Disconnected from {}:{}", config_.host, config_.port);
    }
}

void DeviceClient::handle_transport_connected() {
    if (!state_.on_transport_connected()) {
        spdlog::debug("[Device Client] Ignoring transport connect in state {}",
                      session_state_name(state_.get_state()));
        return;
    }

    if (reconnecting_.exchange(false)) {
        spdlog::info("[Device Client] Reconnected to {}:{}", config_.host, config_.port);
        emit_event(DeviceEventType::RECONNECTED, "Connection to printer restored");
    }

    // Subscriptions do not survive a reconnect; renew every time
    DeviceError err = transport_->subscribe(report_topic());
    if (!err) {
        LOG_ERROR_INTERNAL("[Device Client] Subscribe to {} failed: {}", report_topic(),
                           err.message);
    }
}

void DeviceClient::handle_transport_closed() {
    if (!state_.on_transport_lost()) {
        // Initial connect still failing, or the session was closed on purpose
        spdlog::debug("[Device Client] Transport closed in state {}",
                      session_state_name(state_.get_state()));
        return;
    }

    spdlog::warn("[Device Client] Connection to {}:{} lost, reconnecting every {}ms",
                 config_.host, config_.port, config_.reconnect_delay_ms);
    reconnecting_.store(true);
    mailbox_.cancel(DeviceError::connection_lost(mailbox_.pending_command()));
    emit_event(DeviceEventType::CONNECTION_LOST, "Connection to printer lost", true);
    emit_event(DeviceEventType::RECONNECTING, "Reconnecting to printer", false,
               std::to_string(config_.reconnect_delay_ms) + "ms");
}

void DeviceClient::handle_transport_message(const std::string& topic,
                                            const std::string& payload) {
    if (topic != report_topic()) {
        spdlog::debug("[Device Client] Ignoring message on unexpected topic {}", topic);
        return;
    }
    router_.route(payload);
}

DeviceError DeviceClient::publish(const json& msg) {
    if (get_identity().empty()) {
        return DeviceError::not_connected(DeviceCommandBuilder::command_name(msg));
    }
    std::string payload = msg.dump();
    spdlog::trace("[Device Client] Publishing: {}", payload);
    return transport_->publish(request_topic(), payload);
}

DeviceError DeviceClient::publish_with_reply(const json& msg, json& reply, uint32_t timeout_ms) {
    return await_reply(
        DeviceCommandBuilder::command_name(msg), [&msg]() { return msg; }, reply, timeout_ms);
}

DeviceError DeviceClient::await_reply(const std::string& command,
                                      const std::function<json()>& build, json& reply,
                                      uint32_t timeout_ms) {
    if (get_identity().empty()) {
        return DeviceError::not_connected(command);
    }

    DeviceError err = mailbox_.begin(command);
    if (!err) {
        return err;
    }

    // Armed before publishing so a fast reply cannot be missed
    err = publish(build());
    if (!err) {
        mailbox_.abandon();
        return err;
    }

    const uint32_t timeout = timeout_ms > 0 ? timeout_ms : config_.reply_timeout_ms;
    err = mailbox_.wait(timeout, reply);
    if (err.type == DeviceErrorType::REPLY_TIMEOUT) {
        spdlog::warn("[Device Client] '{}' got no reply within {}ms", command, timeout);
        emit_event(DeviceEventType::REPLY_TIMEOUT, err.message, true, command);
    } else if (!err) {
        spdlog::debug("[Device Client] '{}' failed: {}", command, err.message);
    }
    return err;
}

DeviceError DeviceClient::run_gcode(const std::string& gcode, json& reply) {
    return await_reply(
        "gcode_line",
        [this, &gcode]() { return DeviceCommandBuilder::gcode_line(sequence_.next(), gcode); },
        reply);
}

DeviceError DeviceClient::print_gcode_file(const std::string& url, json& reply) {
    return await_reply(
        "gcode_file",
        [this, &url]() { return DeviceCommandBuilder::gcode_file(sequence_.next(), url); },
        reply);
}

DeviceError DeviceClient::print_project(const ProjectPrintOptions& options, json& reply) {
    if (options.url.empty()) {
        return DeviceError::invalid_argument("project url is empty");
    }
    if (options.plate_id < 1) {
        return DeviceError::invalid_argument("plate id must be 1 or greater");
    }
    return await_reply(
        "project_file",
        [this, &options]() {
            return DeviceCommandBuilder::project_file(sequence_.next(), options);
        },
        reply);
}

DeviceError DeviceClient::stop(json& reply) {
    return await_reply(
        "stop", [this]() { return DeviceCommandBuilder::stop(sequence_.next()); }, reply);
}

DeviceError DeviceClient::pause(json& reply) {
    return await_reply(
        "pause", [this]() { return DeviceCommandBuilder::pause(sequence_.next()); }, reply);
}

DeviceError DeviceClient::resume(json& reply) {
    return await_reply(
        "resume", [this]() { return DeviceCommandBuilder::resume(sequence_.next()); }, reply);
}

DeviceError DeviceClient::stop_no_reply() {
    if (get_identity().empty()) {
        return DeviceError::not_connected("stop");
    }
    return publish(DeviceCommandBuilder::stop(sequence_.next()));
}

DeviceError DeviceClient::request_full_status() {
    if (get_identity().empty()) {
        return DeviceError::not_connected("pushall");
    }
    return publish(DeviceCommandBuilder::push_all(sequence_.next()));
}

void DeviceClient::set_telemetry_handler(TelemetryHandler handler) {
    router_.set_telemetry_handler(std::move(handler));
}

void DeviceClient::register_event_handler(DeviceEventCallback handler) {
    std::lock_guard<std::mutex> lock(event_mutex_);
    event_handler_ = std::move(handler);
}

void DeviceClient::emit_event(DeviceEventType type, const std::string& message, bool is_error,
                              const std::string& details) {
    DeviceEvent evt{type, message, details, is_error};

    DeviceEventCallback handler_copy;
    {
        std::lock_guard<std::mutex> lock(event_mutex_);
        handler_copy = event_handler_;
    }

    if (!handler_copy) {
        spdlog::debug("[Device Client] Event {} (no handler): {}", device_event_name(type),
                      message);
        return;
    }

    try {
        handler_copy(evt);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Device Client] Event handler threw exception: {}", e.what());
    }
}

} // namespace turion
