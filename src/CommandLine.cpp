#include "CommandLine.hpp"

#include <cstdlib>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#ifndef ANIORG_VERSION
#define ANIORG_VERSION "1.0.0"
#endif

namespace {
constexpr int kUsageExitCode = 2;

const std::map<std::string, OperationMode> kModeNames = {
    {"move", OperationMode::Move},
    {"copy", OperationMode::Copy},
    {"link", OperationMode::Link},
};

const std::map<std::string, OperationMode> kFallbackNames = {
    {"move", OperationMode::Move},
    {"copy", OperationMode::Copy},
};
}

CommandLineResult parseCommandLine(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    CommandLineResult result;

    CLI::App app{"Organize `[Group] Title - NN [Tags].ext` episode files into per-title folders.", "aniorg"};
    app.set_version_flag("--version", std::string("aniorg ") + ANIORG_VERSION);
    app.footer("Hard links (--mode=link) use no extra space but need source and target on the same filesystem.\n"
               "Example: aniorg --source=/media/downloads --mode=link --target=/media/anime");

    std::string configPath;
    std::string source;
    std::string target;
    OperationMode mode = OperationMode::Link;
    OperationMode fallbackMode = OperationMode::Move;
    std::vector<std::string> includeExt;
    bool dryRun = false;
    bool verbose = false;

    app.add_option("-c,--config", configPath, "JSON options file; command line flags take precedence");
    auto* sourceOpt = app.add_option("-s,--source", source, "Directory scanned for episode files");
    auto* targetOpt = app.add_option("-t,--target", target, "Target root directory (default: the source directory)");
    auto* modeOpt = app.add_option("-m,--mode", mode, "Operation mode: move, copy or link (default: link)")
                        ->transform(CLI::CheckedTransformer(kModeNames, CLI::ignore_case));
    auto* fallbackOpt = app.add_option("--fallback-on-link-failure", fallbackMode,
                                       "Mode used when a hard link is refused: move or copy (default: no fallback)")
                            ->transform(CLI::CheckedTransformer(kFallbackNames, CLI::ignore_case));
    auto* includeOpt = app.add_option("--include-ext", includeExt,
                                      "Comma separated extensions to organize (default: mp4,mkv,avi,mov,wmv,flv,rmvb)")
                           ->delimiter(',');
    auto* dryRunOpt = app.add_flag("--dry-run", dryRun, "Print the planned transfers without touching any file");
    auto* verboseOpt = app.add_flag("-v,--verbose", verbose, "Report skipped files and every completed transfer");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        result.exitCode = app.exit(e, out, err);
        return result;
    }

    OrganizerOptions options;
    if (!configPath.empty()) {
        ConfigParser parser;
        if (!parser.load(configPath)) {
            err << "Failed to load configuration from `" << configPath << "`." << std::endl;
            result.exitCode = EXIT_FAILURE;
            return result;
        }
        options = parser.getOptions();
    }

    if (sourceOpt->count() > 0) {
        options.source = source;
    }
    if (targetOpt->count() > 0) {
        options.target = target;
    }
    if (modeOpt->count() > 0) {
        options.mode = mode;
    }
    if (fallbackOpt->count() > 0) {
        options.fallbackMode = fallbackMode;
    }
    if (includeOpt->count() > 0) {
        options.extensions = includeExt;
    }
    if (dryRunOpt->count() > 0) {
        options.dryRun = dryRun;
    }
    if (verboseOpt->count() > 0) {
        options.verbose = verbose;
    }

    if (options.source.empty()) {
        err << "A source directory is required: pass --source or set `source` in the options file." << std::endl;
        result.exitCode = kUsageExitCode;
        return result;
    }

    result.options = std::move(options);
    return result;
}
