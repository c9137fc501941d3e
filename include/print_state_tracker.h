// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "hv/json.hpp"

namespace turion {

using json = nlohmann::json;

/**
 * @brief Final result of a tracked print job
 */
enum class PrintOutcome {
    IN_PROGRESS, ///< Job still running (or not started yet)
    FINISHED,    ///< Printer reported gcode_state FINISH
    FAILED       ///< Non-zero print_error or gcode_state FAILED
};

const char* print_outcome_name(PrintOutcome outcome);

/**
 * @brief Snapshot of the job as last reported by the printer
 */
struct PrintProgress {
    std::string gcode_state; ///< IDLE, PREPARE, RUNNING, PAUSE, FINISH, FAILED...
    int percent = 0;         ///< mc_percent
    int remaining_minutes = 0;
    int layer = 0;
    int total_layers = 0;
    uint32_t print_error = 0;
    PrintOutcome outcome = PrintOutcome::IN_PROGRESS;
};

/**
 * @brief Follows a print job through its telemetry frames
 *
 * Telemetry frames are deltas: fields missing from a frame keep their last
 * value. update() runs on the delivery thread, wait_for_outcome() on the
 * caller thread.
 *
 * FINISH is only accepted after the job was seen in another state, so a
 * FINISH left over from the previous job does not end tracking early.
 */
class PrintStateTracker {
  public:
    using ProgressCallback = std::function<void(const PrintProgress&)>;

    PrintStateTracker() = default;

    PrintStateTracker(const PrintStateTracker&) = delete;
    PrintStateTracker& operator=(const PrintStateTracker&) = delete;

    /**
     * @brief Fold one telemetry frame into the tracked state
     *
     * @return Outcome after this frame
     */
    PrintOutcome update(const json& telemetry);

    /**
     * @brief Block until the job finished or failed
     *
     * @param timeout_ms 0 waits forever
     * @return IN_PROGRESS on timeout
     */
    PrintOutcome wait_for_outcome(uint32_t timeout_ms = 0);

    /// Called after every frame that changed state, percent or error
    void set_progress_callback(ProgressCallback callback);

    PrintProgress get_progress() const;

    /// Forget the previous job
    void reset();

  private:
    mutable std::mutex mutex_;
    std::condition_variable outcome_cv_;
    PrintProgress progress_;
    bool seen_active_state_{false};
    ProgressCallback callback_;
};

} // namespace turion
