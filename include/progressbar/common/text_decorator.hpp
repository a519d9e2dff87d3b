#pragma once

#include <string>

namespace progressbar {
namespace common {

// Wraps text in ANSI escapes only when the target is a terminal.
class TextDecorator {
public:
    explicit TextDecorator(bool use_colors = false);

    static TextDecorator forFileDescriptor(int fd);

    std::string colorize(const std::string& text, const std::string& color_code) const;
    std::string bold(const std::string& text) const;
    std::string blue(const std::string& text) const;

    bool usesColors() const { return use_colors_; }

private:
    bool use_colors_;
};

int getTerminalWidth(int fd);

}}
