#include "progressbar/core/renderer.hpp"
#include "progressbar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace progressbar {
namespace core {

Renderer::Renderer(std::ostream& out, common::TextDecorator decorator,
                   std::string unit, int terminal_width)
    : out_(out),
      decorator_(decorator),
      unit_(std::move(unit)),
      terminal_width_(terminal_width),
      last_line_length_(0) {}

bool Renderer::shouldRender(Clock::time_point now,
                            const std::optional<Clock::time_point>& last_render_time,
                            std::chrono::milliseconds render_interval,
                            bool is_final) {
    if (is_final || !last_render_time) {
        return true;
    }
    return now - *last_render_time > render_interval;
}

void Renderer::renderLine(double throughput, int bar_width, int64_t percent, double elapsed, double eta) {
    writeInPlace(formatLine(throughput, bar_width, percent, elapsed, eta), false);
}

void Renderer::renderFinal() {
    writeInPlace(fmt::format("[{}] 100%", formatBar(constants::bar::WIDTH, 100)), true);
}

void Renderer::renderEmpty() {
    writeInPlace(fmt::format("[{}] 0%", formatBar(constants::bar::WIDTH, 0)), false);
}

void Renderer::renderTitle(const std::string& title) {
    if (title.empty()) return;

    int width = std::max(terminal_width_, static_cast<int>(title.size()));
    out_ << decorator_.bold(fmt::format("{:^{}}", title, width)) << "\n" << std::flush;
}

void Renderer::renderSummary(const std::string& duration) {
    out_ << "\n" << decorator_.blue("Execution time: " + duration) << "\n" << std::flush;
    last_line_length_ = 0;
}

std::string Renderer::formatLine(double throughput, int bar_width, int64_t percent,
                                 double elapsed, double eta) const {
    return fmt::format("[{}] {}% (elapsed {:.2f}s, ETA {:.2f}s) {:.2f} {}/s",
                       formatBar(bar_width, percent), percent, elapsed, eta, throughput, unit_);
}

std::string Renderer::formatBar(int bar_width, int64_t percent) {
    // Half scale: one glyph per two percent of a 50-wide bar
    int64_t filled = std::clamp<int64_t>(percent / 2, 0, bar_width);
    std::string bar(static_cast<size_t>(filled), '=');
    bar.append(static_cast<size_t>(bar_width - filled), ' ');
    return bar;
}

std::string Renderer::formatDuration(double total_seconds) {
    double seconds = std::max(total_seconds, 0.0);

    // Units are chosen on the rounded value so a carry never prints "60"
    if (std::lround(seconds * 1000.0) < 1000) {
        return fmt::format("{} ms", std::lround(seconds * 1000.0));
    }
    double centis = std::round(seconds * 100.0) / 100.0;
    if (centis < 60.0) {
        return fmt::format("{:.2f} seconds", centis);
    }
    if (centis < 3600.0) {
        // Seconds within the current minute, labelled as minutes
        return fmt::format("{:.2f} minutes", std::fmod(centis, 60.0));
    }

    long total_minutes = std::lround(seconds / 60.0);
    return fmt::format("{} {:02} minutes", total_minutes / 60, total_minutes % 60);
}

void Renderer::writeInPlace(const std::string& line, bool terminate) {
    std::string padded = line;
    if (last_line_length_ > line.size()) {
        padded.append(last_line_length_ - line.size(), ' ');
    }

    out_ << "\r" << padded;
    if (terminate) {
        out_ << "\n";
        last_line_length_ = 0;
    } else {
        last_line_length_ = line.size();
    }
    out_ << std::flush;
}

}}
