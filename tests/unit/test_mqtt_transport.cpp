// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mqtt_transport.h"

#include "../test_helpers/tls_test_server.h"

#include <atomic>
#include <chrono>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace turion;
using turion::test::TlsTestServer;

namespace {

bool wait_for_handshakes(const TlsTestServer& server, int count, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (server.handshakes() >= count) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

} // namespace

// ============================================================================
// TLS server name
// ============================================================================

TEST_CASE("TLS context presents the identity as server name", "[mqtt_transport]") {
    TlsTestServer server("01P00A391800123");
    REQUIRE(server.start());

    const std::string sni = "01P00A391800123";
    SSL_CTX* ctx = MqttTransport::create_ssl_context(sni);
    REQUIRE(ctx != nullptr);

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(server.port()));
    REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    SSL* ssl = SSL_new(ctx);
    REQUIRE(ssl != nullptr);
    SSL_set_fd(ssl, fd);
    // What a TLS library does with the dialed address; must be overridden
    SSL_set_tlsext_host_name(ssl, const_cast<char*>("127.0.0.1"));
    CHECK(SSL_connect(ssl) == 1);

    SSL_shutdown(ssl);
    SSL_free(ssl);
    ::close(fd);
    SSL_CTX_free(ctx);

    REQUIRE(wait_for_handshakes(server, 1));
    CHECK(server.server_names()[0] == sni);
}

TEST_CASE("TLS context accepts an untrusted certificate", "[mqtt_transport]") {
    TlsTestServer server("SELF-SIGNED");
    REQUIRE(server.start());

    SSL_CTX* ctx = MqttTransport::create_ssl_context("SELF-SIGNED");
    REQUIRE(ctx != nullptr);
    CHECK(SSL_CTX_get_verify_mode(ctx) == SSL_VERIFY_NONE);
    SSL_CTX_free(ctx);
}

TEST_CASE("MqttTransport dials the host with the identity as server name", "[mqtt_transport]") {
    TlsTestServer server("01P00A391800123");
    REQUIRE(server.start());

    MqttTransport transport;
    TransportOptions options;
    options.host = "127.0.0.1";
    options.port = server.port();
    options.username = "bblp";
    options.password = "12345678";
    options.sni_host = "01P00A391800123";
    options.connect_timeout_ms = 2000;

    REQUIRE(transport.open(options, TransportCallbacks{}));
    REQUIRE(wait_for_handshakes(server, 1));
    transport.close();

    CHECK(server.server_names()[0] == "01P00A391800123");
    // The test server never answers CONNECT
    CHECK_FALSE(transport.is_connected());
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("MqttTransport refuses traffic before open", "[mqtt_transport]") {
    MqttTransport transport;
    CHECK_FALSE(transport.is_connected());
    CHECK(transport.publish("device/X/request", "{}").type == DeviceErrorType::PUBLISH);
    CHECK(transport.subscribe("device/X/report").type == DeviceErrorType::NOT_CONNECTED);
}

TEST_CASE("MqttTransport close is idempotent", "[mqtt_transport]") {
    MqttTransport transport;
    transport.close();
    transport.close();
    CHECK_FALSE(transport.is_connected());
}

TEST_CASE("MqttTransport close from the delivery thread is finished by the next close",
          "[mqtt_transport]") {
    TlsTestServer server("01P00A391800123");
    REQUIRE(server.start());

    MqttTransport transport;
    TransportOptions options;
    options.host = "127.0.0.1";
    options.port = server.port();
    options.sni_host = "01P00A391800123";
    options.connect_timeout_ms = 2000;
    options.reconnect_delay_ms = 50;

    // The test server hangs up after the handshake, so on_closed fires on the loop thread
    std::atomic<int> closed_calls{0};
    TransportCallbacks callbacks;
    callbacks.on_closed = [&]() {
        closed_calls++;
        transport.close();
    };

    REQUIRE(transport.open(options, std::move(callbacks)));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (closed_calls.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(closed_calls.load() == 1);

    // Closed but not yet joined: the loop cannot join itself
    CHECK_FALSE(transport.is_connected());

    transport.close();
    CHECK_FALSE(transport.delivery_thread_running());

    // Reconnect was disabled and the guard dropped; nothing else is delivered
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(closed_calls.load() == 1);
}
