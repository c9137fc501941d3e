// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_transport.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "hv/EventLoopThread.h"
#include "hv/mqtt_client.h"

#include <openssl/ssl.h>

namespace turion {

/**
 * @brief MQTT over TLS transport on libhv
 *
 * One hv::EventLoopThread drives the socket and runs every callback; it is the
 * single delivery thread of the session. TLS uses an OpenSSL context with
 * verification disabled whose server name (SNI) is forced to
 * TransportOptions::sni_host, regardless of the address being dialed. The
 * printer's broker selects its certificate by that name.
 */
class MqttTransport : public DeviceTransport {
  public:
    MqttTransport();
    ~MqttTransport() override;

    MqttTransport(const MqttTransport&) = delete;
    MqttTransport& operator=(const MqttTransport&) = delete;

    DeviceError open(const TransportOptions& options, TransportCallbacks callbacks) override;
    DeviceError subscribe(const std::string& topic) override;
    DeviceError publish(const std::string& topic, const std::string& payload) override;
    void close() override;
    bool is_connected() const override;

    /// True until the event loop thread of the last session has been joined
    bool delivery_thread_running() const;

    /**
     * @brief Build the client TLS context
     *
     * @param sni_host Server name to present; must outlive the context
     * @return New context owned by the caller, nullptr on failure
     */
    static SSL_CTX* create_ssl_context(const std::string& sni_host);

  private:
    bool in_loop_thread() const;
    void teardown();

    std::unique_ptr<hv::EventLoopThread> loop_thread_;
    std::unique_ptr<hv::MqttClient> client_;
    SSL_CTX* ssl_ctx_{nullptr};
    std::string sni_host_; // Referenced by ssl_ctx_ app data

    std::string endpoint_;

    // Invalidated by close() so late libhv callbacks return early
    std::shared_ptr<bool> lifetime_guard_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> connected_{false};
};

} // namespace turion
