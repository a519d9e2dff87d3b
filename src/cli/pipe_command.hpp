#pragma once

#include "main_command.hpp"
#include "progressbar/core/progress_bar.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <cstdint>
#include <istream>
#include <ostream>

namespace progressbar {
namespace cli {

// Advances a bar once per line read from the input stream.
class PipeCommand : public MainCommand {
public:
    PipeCommand();

    void setup(CLI::App* app);
    bool validateArguments() const override;
    int execute(std::istream& in, std::ostream& out, std::ostream& err);

    core::BarOptions buildOptions(bool is_terminal) const;

    static void setupSignalHandlers();
    static void requestInterrupt() { interrupted_.store(true); }
    static void clearInterrupt() { interrupted_.store(false); }
    static bool isInterrupted() { return interrupted_.load(); }

private:
    int64_t jobs_;
    bool show_help_;

    static std::atomic<bool> interrupted_;
    static void signalHandlerStatic(int signal);
};

}}
