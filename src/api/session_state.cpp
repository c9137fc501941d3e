// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_state.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace turion {

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::DISCONNECTED:
        return "DISCONNECTED";
    case SessionState::CONNECTING:
        return "CONNECTING";
    case SessionState::AWAITING_FIRST_TELEMETRY:
        return "AWAITING_FIRST_TELEMETRY";
    case SessionState::READY:
        return "READY";
    }
    return "UNKNOWN";
}

bool SessionStateMachine::transition_from(std::initializer_list<SessionState> allowed,
                                          SessionState to) {
    SessionState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = state_;
        if (std::find(allowed.begin(), allowed.end(), old_state) == allowed.end()) {
            spdlog::trace("[Session State] Ignoring {} -> {}", session_state_name(old_state),
                          session_state_name(to));
            return false;
        }
        state_ = to;
    }

    if (to == SessionState::READY) {
        ready_cv_.notify_all();
    }
    notify(old_state, to);
    return true;
}

bool SessionStateMachine::begin_connect(uint64_t* generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::DISCONNECTED) {
            spdlog::trace("[Session State] Ignoring {} -> CONNECTING", session_state_name(state_));
            return false;
        }
        state_ = SessionState::CONNECTING;
        if (generation != nullptr) {
            *generation = generation_;
        }
    }
    notify(SessionState::DISCONNECTED, SessionState::CONNECTING);
    return true;
}

bool SessionStateMachine::on_transport_connected() {
    return transition_from({SessionState::CONNECTING}, SessionState::AWAITING_FIRST_TELEMETRY);
}

bool SessionStateMachine::on_telemetry() {
    return transition_from({SessionState::AWAITING_FIRST_TELEMETRY}, SessionState::READY);
}

bool SessionStateMachine::on_transport_lost() {
    return transition_from({SessionState::AWAITING_FIRST_TELEMETRY, SessionState::READY},
                           SessionState::CONNECTING);
}

void SessionStateMachine::reset() {
    std::unique_lock<std::mutex> lock(mutex_);
    reset_locked(lock);
}

bool SessionStateMachine::reset_session(uint64_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (generation_ != generation) {
        return false;
    }
    reset_locked(lock);
    return true;
}

void SessionStateMachine::reset_locked(std::unique_lock<std::mutex>& lock) {
    SessionState old_state = state_;
    state_ = SessionState::DISCONNECTED;
    generation_++;
    lock.unlock();
    ready_cv_.notify_all();

    if (old_state != SessionState::DISCONNECTED) {
        notify(old_state, SessionState::DISCONNECTED);
    }
}

bool SessionStateMachine::is_current(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_ == generation;
}

bool SessionStateMachine::wait_until_ready(uint32_t timeout_ms) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
    }
    return wait_until_ready(timeout_ms, generation);
}

bool SessionStateMachine::wait_until_ready(uint32_t timeout_ms, uint64_t generation) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
        return state_ == SessionState::READY || generation_ != generation;
    });
    return state_ == SessionState::READY && generation_ == generation;
}

SessionState SessionStateMachine::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SessionStateMachine::is_active() const {
    return get_state() != SessionState::DISCONNECTED;
}

void SessionStateMachine::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void SessionStateMachine::notify(SessionState old_state, SessionState new_state) {
    spdlog::debug("[Session State] {} -> {}", session_state_name(old_state),
                  session_state_name(new_state));

    // Copy under lock, invoke outside so the listener may query the state machine
    StateListener listener_copy;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_copy = listener_;
    }
    if (!listener_copy) {
        return;
    }

    try {
        listener_copy(old_state, new_state);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[Session State] State listener threw exception: {}", e.what());
    }
}

} // namespace turion
