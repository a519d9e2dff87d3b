#pragma once

#include "progress_state.hpp"
#include "renderer.hpp"
#include "../common/constants.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>

namespace progressbar {
namespace core {

struct BarOptions {
    std::string title;
    bool print_on_exit = constants::config_defaults::PRINT_ON_EXIT;
    std::chrono::milliseconds render_interval{constants::config_defaults::RENDER_INTERVAL_MS};
    std::string unit = constants::bar::DEFAULT_UNIT;
    bool use_colors = false;
    int terminal_width = constants::bar::DEFAULT_TERMINAL_WIDTH;
};

/**
 * Single-line progress bar over a known total, or over an unknown one when
 * constructed with constants::bar::UNKNOWN_TOTAL.
 *
 *   ProgressBar bar(jobs.size());
 *   {
 *       ScopedRun run(bar);
 *       for (auto& job : jobs) { job(); bar.increment(); }
 *   }
 *
 * The 100% line is printed at most once, whichever of increment(),
 * complete() or the scope exit gets there first.
 */
class ProgressBar {
public:
    explicit ProgressBar(int64_t total,
                         BarOptions options = {},
                         std::ostream& out = std::cout,
                         TimeSource time_source = systemTimeSource());

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    void increment(uint64_t amount = 1);
    void complete();

    int64_t value() const { return state_.completed(); }
    void setValue(int64_t value) { state_.setCompleted(value); }

    int64_t size() const { return state_.total(); }
    int64_t errors() const { return state_.errors(); }
    int64_t percent() const { return state_.percent(); }
    double throughput() const { return state_.throughput(); }
    double etaSeconds() const { return state_.etaSeconds(); }
    double executionTime() const { return state_.executionSeconds(); }
    Phase phase() const { return state_.phase(); }
    bool isComplete() const { return state_.phase() == Phase::COMPLETED; }

    const BarOptions& options() const { return options_; }
    const ProgressState& state() const { return state_; }

    // Scoped-region protocol, normally driven through ScopedRun.
    void enter();
    void exit() noexcept;

    std::string toString() const;
    nlohmann::json snapshot() const;

private:
    BarOptions options_;
    TimeSource time_source_;
    ProgressState state_;
    Renderer renderer_;
    bool final_rendered_ = false;
    bool exited_ = false;

    void renderFinalOnce();
};

std::ostream& operator<<(std::ostream& out, const ProgressBar& bar);

}}
