#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "progressbar/common/config.hpp"
#include "progressbar/common/constants.hpp"
#include "progressbar/common/logger.hpp"
#include "cli/pipe_command.hpp"

int main(int argc, char** argv) {
    auto pipe_cmd = std::make_unique<progressbar::cli::PipeCommand>();

    try {
        CLI::App app{progressbar::constants::system::APPLICATION_NAME,
                     progressbar::constants::system::APPLICATION_NAME};

        auto& config = progressbar::common::Config::instance();
        progressbar::common::Logger::instance().initialize(
            config.global().log_level,
            config.global().logging
        );

        pipe_cmd->setup(&app);
        app.parse(argc, argv);

        progressbar::cli::PipeCommand::setupSignalHandlers();
        int status = pipe_cmd->execute(std::cin, std::cout, std::cerr);

        progressbar::common::Logger::instance().shutdown();
        return status;

    } catch (const CLI::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        pipe_cmd->printHelp(std::cerr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
