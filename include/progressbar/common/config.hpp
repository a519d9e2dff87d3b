#pragma once

#include <chrono>
#include <string>

namespace progressbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    LogFormat format;
};

struct RenderConfig {
    std::chrono::milliseconds render_interval;
    bool print_on_exit;
    std::string unit;
};

struct GlobalConfig {
    LogLevel log_level;
    LoggingConfig logging;
    RenderConfig render;
};

class Config {
public:
    static Config& instance();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    void reset();

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
};

std::string to_string(LogLevel level);

}}
