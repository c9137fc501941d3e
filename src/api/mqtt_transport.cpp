// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mqtt_transport.h"

#include "device_identity.h"
#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <future>
#include <random>

#include <openssl/err.h>

namespace turion {

namespace {

constexpr auto LOOP_TASK_TIMEOUT = std::chrono::seconds(2);

// Runs at the start of every handshake on connections made from the context,
// after libhv has applied its own hostname, so the identity always wins.
void sni_override_callback(const SSL* ssl, int where, int /*ret*/) {
    if ((where & SSL_CB_HANDSHAKE_START) == 0) {
        return;
    }
    SSL_CTX* ctx = SSL_get_SSL_CTX(ssl);
    const char* server_name = ctx ? static_cast<const char*>(SSL_CTX_get_app_data(ctx)) : nullptr;
    if (server_name == nullptr || *server_name == '\0') {
        return;
    }
    if (SSL_set_tlsext_host_name(const_cast<SSL*>(ssl), const_cast<char*>(server_name)) != 1) {
        LOG_WARN_INTERNAL("[MQTT Transport] Unable to set TLS server name '{}'", server_name);
    }
}

std::string generate_client_id() {
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist;
    char buf[32];
    snprintf(buf, sizeof(buf), "turion-link-%08x", dist(rd));
    return buf;
}

} // namespace

SSL_CTX* MqttTransport::create_ssl_context(const std::string& sni_host) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (ctx == nullptr) {
        spdlog::error("[MQTT Transport] SSL_CTX_new failed: {}", openssl_error_string());
        return nullptr;
    }

    // The broker certificate is issued by the vendor's private CA
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_app_data(ctx, const_cast<char*>(sni_host.c_str()));
    SSL_CTX_set_info_callback(ctx, sni_override_callback);
    return ctx;
}

MqttTransport::MqttTransport() {
    spdlog::trace("[MQTT Transport] Created");
}

MqttTransport::~MqttTransport() {
    close();
    teardown();
}

bool MqttTransport::in_loop_thread() const {
    if (!loop_thread_) {
        return false;
    }
    hv::EventLoopPtr loop = loop_thread_->loop();
    return loop && loop->isInLoopThread();
}

DeviceError MqttTransport::open(const TransportOptions& options, TransportCallbacks callbacks) {
    if (in_loop_thread()) {
        return DeviceError::invalid_argument("open() called from the delivery thread");
    }

    // Reuse is allowed: finish any previous session first
    close();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    teardown();

    endpoint_ = options.host + ":" + std::to_string(options.port);
    sni_host_ = options.sni_host;

    if (options.use_tls) {
        ssl_ctx_ = create_ssl_context(sni_host_);
        if (ssl_ctx_ == nullptr) {
            return DeviceError::connect_failed("unable to create TLS context", endpoint_);
        }
    }

    loop_thread_ = std::make_unique<hv::EventLoopThread>();
    loop_thread_->start(true);

    client_ = std::make_unique<hv::MqttClient>(loop_thread_->hloop());
    std::string client_id = options.client_id.empty() ? generate_client_id() : options.client_id;
    client_->setID(client_id.c_str());
    client_->setAuth(options.username.c_str(), options.password.c_str());
    client_->setPingInterval(options.keepalive_s);
    client_->setConnectTimeout(static_cast<int>(options.connect_timeout_ms));
    if (ssl_ctx_ != nullptr) {
        client_->setSslCtx(ssl_ctx_);
    }

    // Fixed delay, retry forever while open
    reconn_setting_t reconn;
    reconn_setting_init(&reconn);
    reconn.min_delay = options.reconnect_delay_ms;
    reconn.max_delay = options.reconnect_delay_ms;
    reconn.delay_policy = 0;
    client_->setReconnect(&reconn);

    lifetime_guard_ = std::make_shared<bool>(true);
    std::weak_ptr<bool> weak_guard = lifetime_guard_;

    client_->onConnect = [this, weak_guard, on_connected = callbacks.on_connected](
                             hv::MqttClient*) {
        auto guard = weak_guard.lock();
        if (!guard) {
            return;
        }
        spdlog::debug("[MQTT Transport] Connected to {}", endpoint_);
        connected_.store(true);
        if (!on_connected) {
            return;
        }
        try {
            on_connected();
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[MQTT Transport] on_connected threw exception: {}", e.what());
        }
    };

    client_->onClose = [this, weak_guard, on_closed = callbacks.on_closed](hv::MqttClient*) {
        auto guard = weak_guard.lock();
        if (!guard) {
            return;
        }
        connected_.store(false);
        spdlog::debug("[MQTT Transport] Connection to {} closed", endpoint_);
        if (!on_closed) {
            return;
        }
        try {
            on_closed();
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[MQTT Transport] on_closed threw exception: {}", e.what());
        }
    };

    client_->onMessage = [weak_guard, on_message = callbacks.on_message](hv::MqttClient*,
                                                                          mqtt_message_t* msg) {
        auto guard = weak_guard.lock();
        if (!guard || !on_message || msg == nullptr) {
            return;
        }
        std::string topic(msg->topic, msg->topic_len);
        std::string payload(msg->payload, msg->payload_len);
        try {
            on_message(topic, payload);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[MQTT Transport] on_message threw exception: {}", e.what());
        }
    };

    spdlog::info("[MQTT Transport] Connecting to {} (server name '{}', client id '{}')", endpoint_,
                 sni_host_, client_id);

    // libhv I/O handles belong to the loop thread
    auto connect_started = std::make_shared<std::promise<int>>();
    std::future<int> connect_future = connect_started->get_future();
    hv::MqttClient* client = client_.get();
    const std::string host = options.host;
    const int port = options.port;
    const int ssl = options.use_tls ? 1 : 0;
    loop_thread_->loop()->runInLoop([client, host, port, ssl, connect_started]() {
        connect_started->set_value(client->connect(host.c_str(), port, ssl));
    });

    if (connect_future.wait_for(LOOP_TASK_TIMEOUT) == std::future_status::timeout) {
        spdlog::error("[MQTT Transport] Connect request to {} was not scheduled", endpoint_);
        open_.store(true);
        return DeviceError::connect_failed("event loop did not respond", endpoint_);
    }

    int rc = connect_future.get();
    open_.store(true);
    if (rc != 0) {
        spdlog::error("[MQTT Transport] Connect to {} failed to start (code {})", endpoint_, rc);
        return DeviceError::connect_failed("unable to start MQTT connect", endpoint_, rc);
    }
    return DeviceError::success();
}

DeviceError MqttTransport::subscribe(const std::string& topic) {
    if (!client_ || !connected_.load()) {
        return DeviceError::not_connected("subscribe " + topic);
    }
    int rc = client_->subscribe(topic.c_str(), 0);
    if (rc < 0) {
        spdlog::error("[MQTT Transport] Subscribe to {} failed ({})", topic, rc);
        return DeviceError::publish_failed(topic, rc);
    }
    spdlog::debug("[MQTT Transport] Subscribed to {}", topic);
    return DeviceError::success();
}

DeviceError MqttTransport::publish(const std::string& topic, const std::string& payload) {
    if (!client_ || !connected_.load()) {
        return DeviceError::publish_failed(topic, -1);
    }
    int rc = client_->publish(topic, payload, 0, 0);
    if (rc < 0) {
        spdlog::error("[MQTT Transport] Publish to {} failed ({})", topic, rc);
        return DeviceError::publish_failed(topic, rc);
    }
    spdlog::trace("[MQTT Transport] Published to {}: {}", topic, payload);
    return DeviceError::success();
}

void MqttTransport::close() {
    const bool was_open = open_.exchange(false);
    connected_.store(false);

    if (in_loop_thread()) {
        if (!was_open) {
            return;
        }
        // Called from a callback: the thread cannot join itself. Stop it
        // asynchronously and leave the join to the next close(), open() or
        // destructor. Events still queued on the loop are dropped by the guard.
        spdlog::debug("[MQTT Transport] Closing from delivery thread");
        lifetime_guard_.reset();
        client_->setReconnect(nullptr);
        client_->disconnect();
        loop_thread_->stop(false);
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    lifetime_guard_.reset();
    if (!was_open && !loop_thread_) {
        return;
    }
    spdlog::debug("[MQTT Transport] Closing connection to {}", endpoint_);

    if (was_open && loop_thread_ && loop_thread_->isRunning() && client_) {
        auto closed = std::make_shared<std::promise<void>>();
        std::future<void> closed_future = closed->get_future();
        hv::MqttClient* client = client_.get();
        loop_thread_->loop()->runInLoop([client, closed]() {
            // Disable reconnect before disconnecting or libhv schedules a retry
            client->setReconnect(nullptr);
            client->disconnect();
            closed->set_value();
        });
        if (closed_future.wait_for(LOOP_TASK_TIMEOUT) == std::future_status::timeout) {
            spdlog::warn("[MQTT Transport] Disconnect timed out after 2 seconds");
        }
    }
    // Also joins a loop that was stopped from its own thread
    teardown();
}

void MqttTransport::teardown() {
    if (loop_thread_) {
        loop_thread_->stop(true);
        loop_thread_->join();
    }
    // The loop is no longer running; libhv objects can be freed from here
    client_.reset();
    loop_thread_.reset();
    if (ssl_ctx_ != nullptr) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

bool MqttTransport::is_connected() const {
    return connected_.load();
}

bool MqttTransport::delivery_thread_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return loop_thread_ != nullptr;
}

} // namespace turion
