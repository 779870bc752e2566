#include <cstdlib>
#include <iostream>

#include "BatchOrganizer.hpp"
#include "CommandLine.hpp"

int main(int argc, char* argv[]) {
    const CommandLineResult commandLine = parseCommandLine(argc, argv);
    if (commandLine.exitCode) {
        return *commandLine.exitCode;
    }

    BatchOrganizer organizer(commandLine.options);

    const TransferResult preflight = organizer.validate();
    if (!preflight) {
        std::cerr << "Error: " << preflight.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    const OrganizerOptions& options = organizer.options();
    if (options.verbose) {
        std::cout << "Organizing `" << options.source.string() << "` into `" << options.resolvedTarget().string()
                  << "` (mode: " << toString(options.mode) << (options.dryRun ? ", dry run" : "") << ")" << std::endl;
    }

    // Per-file failures are already reported and counted; the run itself still succeeded.
    organizer.organizeAll();
    return EXIT_SUCCESS;
}
