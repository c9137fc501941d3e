// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "print_state_tracker.h"

#include "error_reporting.h"
#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <chrono>

namespace turion {

const char* print_outcome_name(PrintOutcome outcome) {
    switch (outcome) {
    case PrintOutcome::IN_PROGRESS:
        return "IN_PROGRESS";
    case PrintOutcome::FINISHED:
        return "FINISHED";
    case PrintOutcome::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

PrintOutcome PrintStateTracker::update(const json& telemetry) {
    if (!telemetry.is_object() || !telemetry.contains("print") ||
        !telemetry["print"].is_object()) {
        return get_progress().outcome;
    }
    const json& print = telemetry["print"];

    PrintProgress snapshot;
    bool changed = false;
    ProgressCallback callback_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (progress_.outcome != PrintOutcome::IN_PROGRESS) {
            return progress_.outcome;
        }

        if (print.contains("gcode_state") && print["gcode_state"].is_string()) {
            std::string state = print["gcode_state"].get<std::string>();
            if (state != progress_.gcode_state) {
                spdlog::info("[Print Tracker] State: {}", state);
                progress_.gcode_state = state;
                changed = true;
            }
            if (state != "FINISH" && state != "IDLE") {
                seen_active_state_ = true;
            }
        }

        if (print.contains("mc_percent")) {
            int percent = json_util::safe_int(print, "mc_percent", progress_.percent);
            if (percent != progress_.percent) {
                progress_.percent = percent;
                changed = true;
            }
        }
        progress_.remaining_minutes =
            json_util::safe_int(print, "mc_remaining_time", progress_.remaining_minutes);
        progress_.layer = json_util::safe_int(print, "layer_num", progress_.layer);
        progress_.total_layers =
            json_util::safe_int(print, "total_layer_num", progress_.total_layers);

        if (print.contains("print_error")) {
            auto error = static_cast<uint32_t>(
                json_util::safe_int64(print, "print_error", static_cast<int64_t>(0)));
            if (error != progress_.print_error) {
                progress_.print_error = error;
                changed = true;
            }
        }

        if (progress_.print_error != 0) {
            spdlog::error("[Print Tracker] Print error 0x{:08x}", progress_.print_error);
            progress_.outcome = PrintOutcome::FAILED;
        } else if (progress_.gcode_state == "FAILED") {
            spdlog::error("[Print Tracker] Printer reported FAILED");
            progress_.outcome = PrintOutcome::FAILED;
        } else if (progress_.gcode_state == "FINISH" && seen_active_state_) {
            spdlog::info("[Print Tracker] Print completed");
            progress_.outcome = PrintOutcome::FINISHED;
        }

        if (progress_.outcome != PrintOutcome::IN_PROGRESS) {
            changed = true;
        }
        snapshot = progress_;
        callback_copy = callback_;
    }

    if (snapshot.outcome != PrintOutcome::IN_PROGRESS) {
        outcome_cv_.notify_all();
    }

    if (changed && callback_copy) {
        try {
            callback_copy(snapshot);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[Print Tracker] Progress callback threw exception: {}", e.what());
        }
    }
    return snapshot.outcome;
}

PrintOutcome PrintStateTracker::wait_for_outcome(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto done = [this] { return progress_.outcome != PrintOutcome::IN_PROGRESS; };
    if (timeout_ms == 0) {
        outcome_cv_.wait(lock, done);
    } else {
        outcome_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), done);
    }
    return progress_.outcome;
}

void PrintStateTracker::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

PrintProgress PrintStateTracker::get_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

void PrintStateTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = PrintProgress{};
    seen_active_state_ = false;
}

} // namespace turion
