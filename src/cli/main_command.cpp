#include "main_command.hpp"
#include "progressbar/common/constants.hpp"

namespace progressbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::printHelp(std::ostream& out) const {
    out << "Number of jobs/iterations are required\n";
    out << "CLI Usage:\n";
    out << "    command | " << constants::system::APPLICATION_NAME << " <jobs>\n\n";
    out << "Example:\n";
    out << "    find . -type f -exec echo \"{}\" /tmp/media/ \\; | "
        << constants::system::APPLICATION_NAME << " $(find . -type f | wc -l)\n";
}

}}
