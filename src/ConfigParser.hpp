#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "FileOrganizer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// Settings for one batch run, assembled from the options file and the command line.
struct OrganizerOptions {
    std::filesystem::path source;
    // Empty means "organize in place under the source directory".
    std::filesystem::path target;
    OperationMode mode = OperationMode::Link;
    // Mode to retry with when a hard link is refused; only Move or Copy.
    std::optional<OperationMode> fallbackMode;
    bool dryRun = false;
    bool verbose = false;
    // Empty means the built-in video extension list.
    std::vector<std::string> extensions;

    // Target root actually used for the run.
    std::filesystem::path resolvedTarget() const;
};

// Parses an optional JSON options file. The file is only ever read, never written back.
class ConfigParser {
public:
    // Load options from disk; returns false on I/O or validation errors.
    bool load(const std::filesystem::path& filePath);
    // Options read so far; defaults for anything the file does not mention.
    const OrganizerOptions& getOptions() const;
    // Video extensions organized when no allow-list is configured.
    static std::vector<std::string> builtInDefaultExtensions();

private:
    // Expand a leading `~` from $HOME and anchor relative paths at the options file's directory.
    bool resolvePath(const std::string& key, const std::string& value, std::filesystem::path& out) const;
    // Read a mode string from `key`, rejecting unknown values.
    bool parseMode(const nlohmann::json& data, const std::string& key, std::optional<OperationMode>& out) const;
    bool parseBoolean(const nlohmann::json& data, const std::string& key, bool& out) const;
    bool parsePath(const nlohmann::json& data, const std::string& key, std::filesystem::path& out) const;
    bool parseExtensionArray(const nlohmann::json& data);

    OrganizerOptions m_options;
    // Directory holding the file being loaded.
    std::filesystem::path m_baseDirectory;
};

#endif
