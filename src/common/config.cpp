#include "progressbar/common/config.hpp"
#include "progressbar/common/constants.hpp"

namespace progressbar {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

void Config::reset() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::WARN;
    config.logging.format = LogFormat::TEXT;

    config.render.render_interval = std::chrono::milliseconds(RENDER_INTERVAL_MS);
    config.render.print_on_exit = PRINT_ON_EXIT;
    config.render.unit = constants::bar::DEFAULT_UNIT;

    return config;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

}}
