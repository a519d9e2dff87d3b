#include "progressbar/core/progress_bar.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/common/logger.hpp"
#include <utility>

namespace progressbar {
namespace core {

ProgressBar::ProgressBar(int64_t total, BarOptions options, std::ostream& out, TimeSource time_source)
    : options_(std::move(options)),
      time_source_(std::move(time_source)),
      state_(total, time_source_()),
      renderer_(out, common::TextDecorator(options_.use_colors), options_.unit, options_.terminal_width) {

    common::Logger::instance().debug("[Bar] Created: total={}, interval={}ms, print_on_exit={}",
                                     total, options_.render_interval.count(), options_.print_on_exit);

    renderer_.renderTitle(options_.title);

    if (state_.isUnknownTotal()) {
        renderer_.renderEmpty();
    }
}

void ProgressBar::increment(uint64_t amount) {
    auto now = time_source_();

    if (state_.phase() == Phase::CREATED) {
        state_.setPhase(Phase::RUNNING);
    }

    if (!state_.advance(amount, now)) {
        common::Logger::instance().debug("[Bar] {}: total={}, errors={}",
            ProgressErrorCodeHelper::toString(ProgressErrorCode::ARITHMETIC_DEGENERATE),
            state_.total(), state_.errors());
        return;
    }

    if (state_.phase() == Phase::COMPLETED) {
        return;
    }

    if (state_.hasReachedTotal()) {
        renderFinalOnce();
        return;
    }

    if (Renderer::shouldRender(now, state_.lastRenderTime(), options_.render_interval, false)) {
        renderer_.renderLine(state_.throughput(), constants::bar::WIDTH, state_.percent(),
                             state_.elapsedSeconds(), state_.etaSeconds());
        state_.markRendered(now);
    }
}

void ProgressBar::complete() {
    state_.forceComplete();
    renderFinalOnce();
}

void ProgressBar::enter() {
    state_.restart(time_source_());
    exited_ = false;

    if (state_.phase() == Phase::CREATED) {
        state_.setPhase(Phase::RUNNING);
    }
}

void ProgressBar::exit() noexcept {
    if (exited_) return;
    exited_ = true;

    try {
        state_.finish(time_source_());
        state_.setPhase(Phase::COMPLETED);

        if (options_.print_on_exit) {
            renderer_.renderSummary(toString());
        }

        common::Logger::instance().debug("[Bar] Closed: {}", snapshot().dump());
    } catch (const std::exception& e) {
        std::cerr << "[Bar] Failed to close progress bar: " << e.what() << std::endl;
    }
}

std::string ProgressBar::toString() const {
    return Renderer::formatDuration(state_.executionSeconds());
}

nlohmann::json ProgressBar::snapshot() const {
    return nlohmann::json{
        {"total", state_.total()},
        {"value", state_.completed()},
        {"errors", state_.errors()},
        {"progress", state_.percent()},
        {"phase", to_string(state_.phase())},
        {"execution_time", state_.executionSeconds()}
    };
}

void ProgressBar::renderFinalOnce() {
    if (final_rendered_) return;

    renderer_.renderFinal();
    state_.markRendered(time_source_());
    state_.setPhase(Phase::COMPLETED);
    final_rendered_ = true;
}

std::ostream& operator<<(std::ostream& out, const ProgressBar& bar) {
    return out << bar.toString();
}

}}
