#include "progressbar/common/text_decorator.hpp"
#include "progressbar/common/constants.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

namespace progressbar {
namespace common {

TextDecorator::TextDecorator(bool use_colors) : use_colors_(use_colors) {}

TextDecorator TextDecorator::forFileDescriptor(int fd) {
    return TextDecorator(isatty(fd) != 0);
}

std::string TextDecorator::colorize(const std::string& text, const std::string& color_code) const {
    if (!use_colors_ || color_code.empty()) {
        return text;
    }
    return color_code + text + constants::ansi::RESET;
}

std::string TextDecorator::bold(const std::string& text) const {
    return colorize(text, constants::ansi::BOLD);
}

std::string TextDecorator::blue(const std::string& text) const {
    return colorize(text, constants::ansi::BLUE);
}

int getTerminalWidth(int fd) {
    struct winsize w;
    if (isatty(fd) && ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return constants::bar::DEFAULT_TERMINAL_WIDTH;
}

}}
