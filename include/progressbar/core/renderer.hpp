#pragma once

#include "../common/text_decorator.hpp"
#include "progress_state.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace progressbar {
namespace core {

class Renderer {
public:
    Renderer(std::ostream& out, common::TextDecorator decorator,
             std::string unit, int terminal_width);

    // True for the final event, for the very first render, or once more than
    // render_interval has passed since the last one.
    static bool shouldRender(Clock::time_point now,
                             const std::optional<Clock::time_point>& last_render_time,
                             std::chrono::milliseconds render_interval,
                             bool is_final);

    void renderLine(double throughput, int bar_width, int64_t percent, double elapsed, double eta);
    void renderFinal();
    void renderEmpty();
    void renderTitle(const std::string& title);
    void renderSummary(const std::string& duration);

    std::string formatLine(double throughput, int bar_width, int64_t percent,
                           double elapsed, double eta) const;

    static std::string formatBar(int bar_width, int64_t percent);
    static std::string formatDuration(double total_seconds);

private:
    std::ostream& out_;
    common::TextDecorator decorator_;
    std::string unit_;
    int terminal_width_;
    size_t last_line_length_;

    void writeInPlace(const std::string& line, bool terminate);
};

}}
