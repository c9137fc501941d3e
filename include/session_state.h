// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <mutex>

namespace turion {

/**
 * @brief Lifecycle of a device session
 *
 * DISCONNECTED -> CONNECTING            connect() requested / transport dropped
 * CONNECTING -> AWAITING_FIRST_TELEMETRY transport-level CONNACK received
 * AWAITING_FIRST_TELEMETRY -> READY      first push_status frame observed
 * any -> DISCONNECTED                    disconnect() or unrecoverable error
 */
enum class SessionState {
    DISCONNECTED,             // No session
    CONNECTING,               // Transport handshake in flight (initial or reconnect)
    AWAITING_FIRST_TELEMETRY, // Transport up, printer has not reported status yet
    READY                     // Printer reported status, commands accepted
};

const char* session_state_name(SessionState state);

/**
 * @brief Explicit session state machine, independent of the transport
 *
 * Transition methods are called from the delivery thread (transport events)
 * and from caller threads (connect/disconnect). wait_until_ready() is the
 * suspension point of connect().
 */
class SessionStateMachine {
  public:
    using StateListener = std::function<void(SessionState old_state, SessionState new_state)>;

    SessionStateMachine() = default;

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    /**
     * @brief DISCONNECTED -> CONNECTING
     *
     * @param generation If set, receives the id of the session attempt; pass it
     *        to is_current() or wait_until_ready() to detect a reset()
     * @return false if a session is already active
     */
    bool begin_connect(uint64_t* generation = nullptr);

    /// CONNECTING -> AWAITING_FIRST_TELEMETRY
    bool on_transport_connected();

    /**
     * @brief AWAITING_FIRST_TELEMETRY -> READY
     *
     * @return true only for the frame that completed the connection
     */
    bool on_telemetry();

    /// AWAITING_FIRST_TELEMETRY or READY -> CONNECTING (automatic reconnect)
    bool on_transport_lost();

    /// Any state -> DISCONNECTED. Wakes a blocked wait_until_ready().
    void reset();

    /// reset(), but only while the session attempt generation is still current
    bool reset_session(uint64_t generation);

    /// False once reset() has ended the session attempt generation
    bool is_current(uint64_t generation) const;

    /**
     * @brief Block until READY
     *
     * @param timeout_ms Maximum wait
     * @return true if READY was reached, false on timeout or reset()
     */
    bool wait_until_ready(uint32_t timeout_ms);

    /// As above, but also returns false at once if generation was already reset
    bool wait_until_ready(uint32_t timeout_ms, uint64_t generation);

    SessionState get_state() const;

    /// True in every state except DISCONNECTED
    bool is_active() const;

    /// Listener is invoked outside the internal lock on every effective transition
    void set_state_listener(StateListener listener);

  private:
    bool transition_from(std::initializer_list<SessionState> allowed, SessionState to);
    void notify(SessionState old_state, SessionState new_state);
    void reset_locked(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    SessionState state_{SessionState::DISCONNECTED};
    uint64_t generation_{0}; // Bumped by reset() so waiters can detect cancellation

    std::mutex listener_mutex_;
    StateListener listener_;
};

} // namespace turion
