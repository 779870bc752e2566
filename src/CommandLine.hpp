#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "ConfigParser.hpp"

#include <iostream>
#include <optional>

// Outcome of command line parsing. When exitCode is set the process should stop
// (help, version, usage or configuration errors) and `options` is meaningless.
struct CommandLineResult {
    std::optional<int> exitCode;
    OrganizerOptions options;
};

// Parse argv, loading `--config` first and letting explicit flags override it.
CommandLineResult parseCommandLine(int argc, const char* const* argv,
                                   std::ostream& out = std::cout, std::ostream& err = std::cerr);

#endif
