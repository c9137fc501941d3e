// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reply_mailbox.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace turion {

DeviceError ReplyMailbox::begin(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_) {
        spdlog::warn("[Reply Mailbox] Rejecting '{}': '{}' is still waiting for a reply",
                     command, command_);
        return DeviceError::busy(command);
    }

    armed_ = true;
    filled_ = false;
    cancelled_ = false;
    reply_ = json();
    cancel_reason_ = DeviceError::success();
    command_ = command;
    spdlog::trace("[Reply Mailbox] Armed for '{}'", command);
    return DeviceError::success();
}

bool ReplyMailbox::deliver(json reply) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || filled_ || cancelled_) {
            return false;
        }
        reply_ = std::move(reply);
        filled_ = true;
    }
    cv_.notify_all();
    return true;
}

DeviceError ReplyMailbox::wait(uint32_t timeout_ms, json& reply) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!armed_) {
        return DeviceError::invalid_argument("wait() without begin()");
    }

    bool done = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return filled_ || cancelled_; });

    DeviceError result;
    if (filled_) {
        reply = std::move(reply_);
    } else if (cancelled_) {
        result = cancel_reason_;
    } else if (!done) {
        result = DeviceError::reply_timeout(command_, timeout_ms);
    }

    disarm_locked();
    return result;
}

void ReplyMailbox::abandon() {
    std::lock_guard<std::mutex> lock(mutex_);
    disarm_locked();
}

void ReplyMailbox::cancel(const DeviceError& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || filled_) {
            return;
        }
        spdlog::debug("[Reply Mailbox] Cancelling wait for '{}': {}", command_, reason.message);
        cancelled_ = true;
        cancel_reason_ = reason;
    }
    cv_.notify_all();
}

bool ReplyMailbox::is_armed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

std::string ReplyMailbox::pending_command() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_ ? command_ : std::string();
}

void ReplyMailbox::disarm_locked() {
    armed_ = false;
    filled_ = false;
    cancelled_ = false;
    reply_ = json();
    command_.clear();
}

} // namespace turion
