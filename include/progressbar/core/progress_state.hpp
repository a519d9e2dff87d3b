#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace progressbar {
namespace core {

using Clock = std::chrono::steady_clock;
using TimeSource = std::function<Clock::time_point()>;

TimeSource systemTimeSource();

enum class Phase {
    CREATED,
    RUNNING,
    COMPLETED
};

std::string to_string(Phase phase);

// Counters, timestamps and derived metrics of one unit of work.
// Metrics are only refreshed by advance(); a raw setCompleted() leaves them stale.
class ProgressState {
public:
    ProgressState(int64_t total_units, Clock::time_point start_time);

    // Adds amount and recomputes percent, throughput and ETA at `now`.
    // Returns false, and counts an error, when the total is zero or unknown.
    bool advance(uint64_t amount, Clock::time_point now);

    void forceComplete();
    void restart(Clock::time_point now);
    void finish(Clock::time_point now);

    void markRendered(Clock::time_point now) { last_render_time_ = now; }
    void setPhase(Phase phase) { phase_ = phase; }

    int64_t total() const { return total_units_; }
    int64_t completed() const { return completed_units_; }
    void setCompleted(int64_t value) { completed_units_ = value; }
    int64_t errors() const { return error_count_; }

    bool isUnknownTotal() const;
    bool hasReachedTotal() const;

    int64_t percent() const { return progress_percent_; }
    double throughput() const { return throughput_; }
    double etaSeconds() const { return eta_seconds_; }
    double elapsedSeconds() const { return elapsed_seconds_; }
    double executionSeconds() const { return execution_seconds_; }

    const std::optional<Clock::time_point>& lastRenderTime() const { return last_render_time_; }
    const std::optional<Clock::time_point>& endTime() const { return end_time_; }
    Phase phase() const { return phase_; }

private:
    int64_t total_units_;
    int64_t completed_units_ = 0;
    int64_t error_count_ = 0;

    int64_t progress_percent_ = 0;
    double throughput_ = 0.0;
    double eta_seconds_ = 0.0;
    double elapsed_seconds_ = 0.0;
    double execution_seconds_ = 0.0;

    Clock::time_point start_time_;
    std::optional<Clock::time_point> last_render_time_;
    std::optional<Clock::time_point> end_time_;
    Phase phase_ = Phase::CREATED;
};

}}
