// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Single-slot handoff between the delivery thread and one blocked caller
 *
 * The device protocol carries no correlation id in its replies, so at most one
 * reply-awaiting call may be in flight. The slot is armed by the caller before
 * publishing, filled by the delivery thread and drained by the same caller.
 *
 * A reply arriving while the slot is not armed is unsolicited and is dropped
 * rather than queued for the next call.
 */
class ReplyMailbox {
  public:
    ReplyMailbox() = default;

    // Non-copyable (has mutex)
    ReplyMailbox(const ReplyMailbox&) = delete;
    ReplyMailbox& operator=(const ReplyMailbox&) = delete;

    /**
     * @brief Arm the slot for one call
     *
     * @param command Command name for logging
     * @return BUSY error if another call already holds the slot
     */
    DeviceError begin(const std::string& command);

    /**
     * @brief Fill the armed slot (delivery thread)
     *
     * @return false if no call was waiting or the slot was already filled
     */
    bool deliver(json reply);

    /**
     * @brief Block until the armed slot is filled, cancelled or the timeout expires
     *
     * Always disarms the slot before returning.
     *
     * @param timeout_ms Maximum wait in milliseconds
     * @param reply Output: the delivered reply on success
     */
    DeviceError wait(uint32_t timeout_ms, json& reply);

    /// Disarm without waiting (publish failed after begin())
    void abandon();

    /**
     * @brief Wake a blocked waiter with an error
     *
     * No-op when no call holds the slot.
     */
    void cancel(const DeviceError& reason);

    bool is_armed() const;

    /// Command name of the call currently holding the slot (empty if none)
    std::string pending_command() const;

  private:
    void disarm_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_{false};
    bool filled_{false};
    bool cancelled_{false};
    json reply_;
    DeviceError cancel_reason_;
    std::string command_;
};

} // namespace turion
