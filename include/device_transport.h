// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"

#include <cstdint>
#include <functional>
#include <string>

namespace turion {

/**
 * @brief Connection parameters for a device transport
 */
struct TransportOptions {
    std::string host;
    int port = 8883;
    std::string username;
    std::string password;
    std::string client_id;            ///< Generated when empty
    std::string sni_host;             ///< TLS server name, independent of host
    uint32_t connect_timeout_ms = 10000;
    uint32_t reconnect_delay_ms = 1000; ///< Fixed delay between reconnect attempts
    int keepalive_s = 60;
    bool use_tls = true;
};

/**
 * @brief Transport events
 *
 * All three run on the transport's single delivery thread. on_connected fires
 * for the initial connect and for every automatic reconnect.
 */
struct TransportCallbacks {
    std::function<void()> on_connected;
    std::function<void()> on_closed;
    std::function<void(const std::string& topic, const std::string& payload)> on_message;
};

/**
 * @brief Publish/subscribe channel to the device
 *
 * Implementations own the delivery thread: open() starts it, close() stops and
 * joins it. While open, a dropped connection is re-established automatically.
 */
class DeviceTransport {
  public:
    virtual ~DeviceTransport() = default;

    /**
     * @brief Start connecting
     *
     * Returns once the connect attempt is under way; completion is reported
     * through on_connected.
     *
     * @return CONNECT error if the attempt could not be started
     */
    virtual DeviceError open(const TransportOptions& options, TransportCallbacks callbacks) = 0;

    /// Subscribe with QoS 0. Safe to call from on_connected.
    virtual DeviceError subscribe(const std::string& topic) = 0;

    /// Publish with QoS 0, not retained
    virtual DeviceError publish(const std::string& topic, const std::string& payload) = 0;

    /**
     * @brief Disable reconnection, disconnect and release the delivery thread
     *
     * Idempotent.
     */
    virtual void close() = 0;

    virtual bool is_connected() const = 0;
};

} // namespace turion
