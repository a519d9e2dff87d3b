#pragma once

#include <cstdint>
#include <string>

namespace progressbar {
namespace constants {

namespace system {
    constexpr const char* APPLICATION_NAME = "progressbar";
    constexpr const char* LOGGER_NAME = "progressbar";
}

namespace bar {
    constexpr int64_t UNKNOWN_TOTAL = -1;
    constexpr int WIDTH = 50;
    constexpr int DEFAULT_TERMINAL_WIDTH = 80;
    constexpr const char* DEFAULT_UNIT = "it";
}

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* BLUE = "\033[34m";
}

namespace config_defaults {
    constexpr int RENDER_INTERVAL_MS = 100;
    constexpr bool PRINT_ON_EXIT = true;
}

}
}
