#include "progressbar/core/progress_state.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/common/constants.hpp"
#include <limits>
#include <utility>

namespace progressbar {
namespace core {

TimeSource systemTimeSource() {
    return [] { return Clock::now(); };
}

std::string to_string(Phase phase) {
    switch (phase) {
        case Phase::CREATED: return "CREATED";
        case Phase::RUNNING: return "RUNNING";
        case Phase::COMPLETED: return "COMPLETED";
        default: return "UNKNOWN";
    }
}

ProgressState::ProgressState(int64_t total_units, Clock::time_point start_time)
    : total_units_(total_units),
      start_time_(start_time) {
    if (total_units_ < 0 && total_units_ != constants::bar::UNKNOWN_TOTAL) {
        common::ErrorContext context;
        context.component = "ProgressState";
        context.details["total"] = std::to_string(total_units_);
        throw ProgressError(ProgressErrorCode::INVALID_TOTAL_KIND, std::move(context));
    }
}

static int64_t clampToInt64(__int128 value) {
    if (value > std::numeric_limits<int64_t>::max()) return std::numeric_limits<int64_t>::max();
    if (value < std::numeric_limits<int64_t>::min()) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(value);
}

// Counters saturate at INT64_MAX rather than wrapping
static int64_t saturatingAdd(int64_t value, uint64_t amount) {
    return clampToInt64(static_cast<__int128>(value) + amount);
}

// floor(completed * 100 / total) for total > 0, without overflowing the product
static int64_t percentOf(int64_t completed, int64_t total) {
    return clampToInt64(static_cast<__int128>(completed) * 100 / total);
}

bool ProgressState::advance(uint64_t amount, Clock::time_point now) {
    completed_units_ = saturatingAdd(completed_units_, amount);

    if (total_units_ <= 0) {
        ++error_count_;
        return false;
    }

    progress_percent_ = percentOf(completed_units_, total_units_);

    elapsed_seconds_ = std::chrono::duration<double>(now - start_time_).count();
    throughput_ = elapsed_seconds_ > 0.0 ? completed_units_ / elapsed_seconds_ : 0.0;
    eta_seconds_ = completed_units_ > 0
        ? (elapsed_seconds_ / completed_units_) *
              (static_cast<double>(total_units_) - static_cast<double>(completed_units_))
        : 0.0;

    return true;
}

void ProgressState::forceComplete() {
    if (isUnknownTotal()) return;

    completed_units_ = total_units_;
    if (total_units_ > 0) {
        progress_percent_ = 100;
    }
}

void ProgressState::restart(Clock::time_point now) {
    start_time_ = now;
    end_time_.reset();
    execution_seconds_ = 0.0;
}

void ProgressState::finish(Clock::time_point now) {
    end_time_ = now;
    execution_seconds_ = std::chrono::duration<double>(now - start_time_).count();
    if (execution_seconds_ < 0.0) {
        execution_seconds_ = 0.0;
    }
}

bool ProgressState::isUnknownTotal() const {
    return total_units_ == constants::bar::UNKNOWN_TOTAL;
}

bool ProgressState::hasReachedTotal() const {
    return total_units_ > 0 && completed_units_ >= total_units_;
}

}}
