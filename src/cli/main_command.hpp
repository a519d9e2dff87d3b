#pragma once

#include <CLI/CLI.hpp>
#include <ostream>
#include <string>

namespace progressbar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    void printHelp(std::ostream& out) const;
};

}}
