// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reply_mailbox.h"

#include <chrono>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace turion;

// ============================================================================
// Arming
// ============================================================================

TEST_CASE("ReplyMailbox rejects a second caller while armed", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("stop"));
    CHECK(mailbox.is_armed());
    CHECK(mailbox.pending_command() == "stop");

    DeviceError err = mailbox.begin("pause");
    CHECK(err.type == DeviceErrorType::BUSY);
    CHECK(mailbox.pending_command() == "stop");
}

TEST_CASE("ReplyMailbox abandon frees the slot", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("stop"));
    mailbox.abandon();
    CHECK_FALSE(mailbox.is_armed());
    CHECK(mailbox.pending_command().empty());
    CHECK(mailbox.begin("pause"));
}

TEST_CASE("ReplyMailbox wait without begin is an error", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    json reply;
    DeviceError err = mailbox.wait(10, reply);
    CHECK(err.type == DeviceErrorType::INVALID_ARGUMENT);
}

// ============================================================================
// Delivery
// ============================================================================

TEST_CASE("ReplyMailbox drops replies when nobody waits", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    CHECK_FALSE(mailbox.deliver(json{{"print", {{"result", "success"}}}}));

    // A dropped reply is not handed to the next caller
    REQUIRE(mailbox.begin("stop"));
    json reply;
    DeviceError err = mailbox.wait(30, reply);
    CHECK(err.type == DeviceErrorType::REPLY_TIMEOUT);
    CHECK(err.detail == "stop");
}

TEST_CASE("ReplyMailbox returns a reply delivered before wait", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("stop"));
    json sent = {{"print", {{"command", "stop"}, {"result", "success"}}}};
    REQUIRE(mailbox.deliver(sent));

    // Only the first reply fills the slot
    CHECK_FALSE(mailbox.deliver(json{{"print", {{"result", "late"}}}}));

    json reply;
    REQUIRE(mailbox.wait(100, reply));
    CHECK(reply == sent);
    CHECK_FALSE(mailbox.is_armed());
}

TEST_CASE("ReplyMailbox wakes a waiter from another thread", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("gcode_line"));

    std::thread delivery([&mailbox]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        mailbox.deliver(json{{"print", {{"result", "success"}}}});
    });

    json reply;
    DeviceError err = mailbox.wait(2000, reply);
    delivery.join();

    REQUIRE(err);
    CHECK(reply["print"]["result"] == "success");
}

TEST_CASE("ReplyMailbox passes non-object replies through", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("stop"));
    REQUIRE(mailbox.deliver(json("not json at all")));

    json reply;
    REQUIRE(mailbox.wait(100, reply));
    CHECK(reply.is_string());
    CHECK(reply.get<std::string>() == "not json at all");
}

// ============================================================================
// Timeout and cancellation
// ============================================================================

TEST_CASE("ReplyMailbox times out and disarms", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("pause"));

    json reply;
    auto start = std::chrono::steady_clock::now();
    DeviceError err = mailbox.wait(50, reply);
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(45));

    CHECK(err.type == DeviceErrorType::REPLY_TIMEOUT);
    CHECK_FALSE(mailbox.is_armed());

    // Reply for the timed-out call arrives late and is dropped
    CHECK_FALSE(mailbox.deliver(json{{"print", {{"result", "success"}}}}));
}

TEST_CASE("ReplyMailbox cancel wakes the waiter with the given reason", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    REQUIRE(mailbox.begin("stop"));

    std::thread canceller([&mailbox]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        mailbox.cancel(DeviceError::connection_lost("stop"));
    });

    json reply;
    auto start = std::chrono::steady_clock::now();
    DeviceError err = mailbox.wait(5000, reply);
    canceller.join();

    CHECK(err.type == DeviceErrorType::CONNECTION_LOST);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
    CHECK_FALSE(mailbox.is_armed());
}

TEST_CASE("ReplyMailbox cancel without a waiter is a no-op", "[reply_mailbox]") {
    ReplyMailbox mailbox;
    mailbox.cancel(DeviceError::cancelled());

    REQUIRE(mailbox.begin("stop"));
    REQUIRE(mailbox.deliver(json{{"print", {{"result", "success"}}}}));
    // Already filled: the reply wins over a late cancel
    mailbox.cancel(DeviceError::cancelled("stop"));

    json reply;
    CHECK(mailbox.wait(100, reply));
}
