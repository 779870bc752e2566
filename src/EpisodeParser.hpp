#ifndef EPISODE_PARSER_HPP
#define EPISODE_PARSER_HPP

#include <filesystem>
#include <optional>
#include <regex>
#include <string>

// EpisodeRecord holds the metadata extracted from a `[Group] Title - NN [Tags].ext` file name.
// Fields are fixed at construction so targetFileName() always agrees with them.
struct EpisodeRecord {
    const std::string group;
    const std::string title;
    // Always at least two digits, left-padded with zeros.
    const std::string episodeNumber;
    // Raw bracketed suffix, e.g. `[1080P][WEB-DL]`.
    const std::string tags;
    // Lower-case and includes the leading dot.
    const std::string extension;
    const std::string sourcePath;

    // Name the episode receives inside its title folder: `NN [Tags].ext`.
    std::string targetFileName() const;

    bool operator==(const EpisodeRecord& other) const;
    bool operator!=(const EpisodeRecord& other) const;
};

// Extracts episode metadata from release file names.
class EpisodeParser {
public:
    // Returns std::nullopt when the base name does not match the release naming convention.
    static std::optional<EpisodeRecord> parse(const std::filesystem::path& filePath);
    // Left-pad episode digits with zeros to a width of two; longer runs are kept as-is.
    static std::string padEpisodeNumber(std::string digits);

private:
    // Compiled once on first use and shared by every parse call.
    static const std::regex& releasePattern();
    // Strips ASCII whitespace plus U+00A0 and U+3000, which release names use as separators.
    static std::string trim(const std::string& value);
    static std::string toLower(std::string value);
};

#endif
