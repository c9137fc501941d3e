// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_commands.h"
#include "device_error.h"
#include "device_events.h"
#include "device_transport.h"
#include "message_router.h"
#include "reply_mailbox.h"
#include "session_state.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Everything needed to reach one printer
 */
struct DeviceConnectionConfig {
    std::string host;
    int port = 8883;
    std::string username = "bblp";
    std::string password; ///< LAN access code
    std::string serial;   ///< Known identity; probed from the certificate when empty
    std::string client_id;
    bool use_tls = true;

    uint32_t connect_timeout_ms = 30000; ///< Bound on waiting for the first telemetry frame
    uint32_t reply_timeout_ms = 10000;   ///< Default bound for publish_with_reply()
    uint32_t probe_timeout_ms = 5000;
    uint32_t reconnect_delay_ms = 1000;
    int keepalive_s = 60;
};

/**
 * @brief Synchronous RPC client for a LAN-mode printer
 *
 * Turns the printer's MQTT channel into blocking calls. Two threads are
 * involved: the caller thread(s) and the transport's delivery thread, which
 * also runs the telemetry handler. At most one reply-awaiting call is in
 * flight at a time; a concurrent one fails with BUSY.
 *
 * Usage:
 * @code
 *   DeviceClient client(config);
 *   client.set_telemetry_handler([](const json& status) { ... });
 *   if (auto err = client.connect(); !err) { ... }
 *   json reply;
 *   client.stop(reply);
 *   client.disconnect();
 * @endcode
 */
class DeviceClient {
  public:
    /**
     * @param config Connection parameters
     * @param transport Transport to use; an MqttTransport when nullptr
     */
    explicit DeviceClient(DeviceConnectionConfig config,
                          std::unique_ptr<DeviceTransport> transport = nullptr);
    ~DeviceClient();

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    /**
     * @brief Probe the identity from the certificate unless already known
     *
     * Probes at most once successfully per client.
     */
    DeviceError resolve_identity();

    void set_identity(const std::string& identity);
    std::string get_identity() const;

    /**
     * @brief Open the session and wait for the first telemetry frame
     *
     * Returns success immediately if the session is already READY, BUSY if
     * another connect() is in progress.
     *
     * @return IDENTITY or CONNECT error; CANCELLED if disconnect() interrupted the wait
     */
    DeviceError connect();

    /**
     * @brief Close the session
     *
     * Idempotent. A blocked connect() or publish_with_reply() returns CANCELLED.
     */
    void disconnect();

    /// Fire-and-forget publish to the request topic
    DeviceError publish(const json& msg);

    /**
     * @brief Publish and block until the next reply
     *
     * @param msg Command document
     * @param reply Output: the reply exactly as received
     * @param timeout_ms Reply timeout; 0 uses DeviceConnectionConfig::reply_timeout_ms
     */
    DeviceError publish_with_reply(const json& msg, json& reply, uint32_t timeout_ms = 0);

    // Sequence ids are drawn only once the reply slot is held, so a BUSY or
    // not-connected command does not use one. A publish the transport refuses does.
    DeviceError run_gcode(const std::string& gcode, json& reply);
    DeviceError print_gcode_file(const std::string& url, json& reply);
    DeviceError print_project(const ProjectPrintOptions& options, json& reply);
    DeviceError stop(json& reply);
    DeviceError pause(json& reply);
    DeviceError resume(json& reply);

    /// Stop without waiting for the acknowledgement
    DeviceError stop_no_reply();

    /// Ask the printer for a complete status frame (delivered as telemetry)
    DeviceError request_full_status();

    /**
     * @brief Replace the telemetry handler (nullptr clears it)
     *
     * Waits for a running invocation of the previous handler unless called
     * from within it.
     */
    void set_telemetry_handler(TelemetryHandler handler);

    /**
     * @brief Set the handler for transport events
     *
     * Events without a handler are only logged.
     */
    void register_event_handler(DeviceEventCallback handler);

    SessionState get_state() const {
        return state_.get_state();
    }

    bool is_ready() const {
        return state_.get_state() == SessionState::READY;
    }

    std::string report_topic() const;
    std::string request_topic() const;

    const DeviceConnectionConfig& get_config() const {
        return config_;
    }

    uint64_t unsolicited_reply_count() const {
        return router_.unsolicited_count();
    }

  private:
    void handle_transport_connected();
    void handle_transport_closed();
    void handle_transport_message(const std::string& topic, const std::string& payload);
    void emit_event(DeviceEventType type, const std::string& message, bool is_error = false,
                    const std::string& details = "");
    TransportOptions transport_options() const;

    /// Arm the mailbox for command, then build, publish and wait
    DeviceError await_reply(const std::string& command, const std::function<json()>& build,
                            json& reply, uint32_t timeout_ms = 0);

    DeviceConnectionConfig config_;
    std::unique_ptr<DeviceTransport> transport_;

    mutable std::mutex identity_mutex_;
    std::string identity_;

    SequenceCounter sequence_;
    SessionStateMachine state_;
    ReplyMailbox mailbox_;
    MessageRouter router_;

    std::mutex event_mutex_;
    DeviceEventCallback event_handler_;

    std::atomic<bool> reconnecting_{false};
};

} // namespace turion
