#include "pipe_command.hpp"
#include "progressbar/common/config.hpp"
#include "progressbar/common/logger.hpp"
#include "progressbar/common/text_decorator.hpp"
#include "progressbar/core/error_codes.hpp"
#include "progressbar/core/scoped_run.hpp"
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>

namespace progressbar {
namespace cli {

std::atomic<bool> PipeCommand::interrupted_{false};

PipeCommand::PipeCommand() : jobs_(0), show_help_(false) {}

void PipeCommand::setup(CLI::App* app) {
    // -h reports usage as a failed invocation, so CLI11's own help flag is replaced
    app->set_help_flag();
    app->add_flag("-h,--help", show_help_, "Show usage and exit");
    app->add_option("jobs", jobs_, "Number of jobs/iterations expected on stdin");
}

bool PipeCommand::validateArguments() const {
    return !show_help_ && jobs_ > 0;
}

core::BarOptions PipeCommand::buildOptions(bool is_terminal) const {
    const auto& render = common::Config::instance().global().render;

    core::BarOptions options;
    options.print_on_exit = render.print_on_exit;
    options.render_interval = render.render_interval;
    options.unit = render.unit;
    options.use_colors = is_terminal;
    options.terminal_width = common::getTerminalWidth(STDOUT_FILENO);
    return options;
}

int PipeCommand::execute(std::istream& in, std::ostream& out, std::ostream& err) {
    if (!validateArguments()) {
        printHelp(err);
        return 1;
    }

    err << jobs_ << std::endl;

    bool is_terminal = (&out == &std::cout) &&
        common::TextDecorator::forFileDescriptor(STDOUT_FILENO).usesColors();
    core::ProgressBar bar(jobs_, buildOptions(is_terminal), out);

    {
        core::ScopedRun run(bar);

        std::string line;
        while (!isInterrupted() && std::getline(in, line)) {
            bar.increment();
        }

        if (isInterrupted()) {
            common::Logger::instance().info("[Cli] {} after {} of {} lines",
                core::ProgressErrorCodeHelper::getMessage(core::ProgressErrorCode::INTERRUPTED_BY_USER),
                bar.value(), bar.size());
            bar.complete();
        }
    }

    return 0;
}

void PipeCommand::setupSignalHandlers() {
    // No SA_RESTART: a blocked read on stdin must return so the loop can finish
    struct sigaction action {};
    action.sa_handler = &PipeCommand::signalHandlerStatic;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

void PipeCommand::signalHandlerStatic(int) {
    interrupted_.store(true);
}

}}
