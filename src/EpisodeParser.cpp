#include "EpisodeParser.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {
constexpr std::size_t kMinEpisodeWidth = 2;

// UTF-8 encodings of NO-BREAK SPACE and IDEOGRAPHIC SPACE.
constexpr char kNoBreakSpace[] = "\xC2\xA0";
constexpr char kIdeographicSpace[] = "\xE3\x80\x80";

// Length of the whitespace sequence starting at `pos`, or 0 when there is none.
std::size_t whitespaceAt(const std::string& value, std::size_t pos) {
    if (std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
        return 1;
    }
    if (value.compare(pos, 2, kNoBreakSpace) == 0) {
        return 2;
    }
    if (value.compare(pos, 3, kIdeographicSpace) == 0) {
        return 3;
    }
    return 0;
}

// Same check for the sequence ending just before `end`.
std::size_t whitespaceBefore(const std::string& value, std::size_t end) {
    if (std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        return 1;
    }
    if (end >= 2 && value.compare(end - 2, 2, kNoBreakSpace) == 0) {
        return 2;
    }
    if (end >= 3 && value.compare(end - 3, 3, kIdeographicSpace) == 0) {
        return 3;
    }
    return 0;
}

enum Capture : std::size_t {
    kGroup = 1,
    kTitle,
    kEpisode,
    kTags,
    kExtension
};
}

std::string EpisodeRecord::targetFileName() const {
    return episodeNumber + " " + tags + extension;
}

bool EpisodeRecord::operator==(const EpisodeRecord& other) const {
    return group == other.group && title == other.title && episodeNumber == other.episodeNumber &&
           tags == other.tags && extension == other.extension && sourcePath == other.sourcePath;
}

bool EpisodeRecord::operator!=(const EpisodeRecord& other) const {
    return !(*this == other);
}

const std::regex& EpisodeParser::releasePattern() {
    // [Group] Title - NN [Tags][More Tags].ext, where each gap may also be a no-break or ideographic space.
    static const std::regex pattern(
        R"(^\[([^\]]+)\](?:\s|\xC2\xA0|\xE3\x80\x80)+(.+?)(?:\s|\xC2\xA0|\xE3\x80\x80)+-)"
        R"((?:\s|\xC2\xA0|\xE3\x80\x80)+(\d+)(?:\s|\xC2\xA0|\xE3\x80\x80)+(\[.+\])(\.\w+)$)",
        std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

std::optional<EpisodeRecord> EpisodeParser::parse(const std::filesystem::path& filePath) {
    const std::string fileName = filePath.filename().string();
    if (fileName.empty()) {
        return std::nullopt;
    }

    std::smatch match;
    try {
        if (!std::regex_match(fileName, match, releasePattern())) {
            return std::nullopt;
        }
    } catch (const std::regex_error&) {
        // Pathological names can exhaust the matcher; they are simply not recognized.
        return std::nullopt;
    }

    std::string group = trim(match[kGroup].str());
    std::string title = trim(match[kTitle].str());
    if (group.empty() || title.empty()) {
        return std::nullopt;
    }

    return EpisodeRecord{std::move(group),
                         std::move(title),
                         padEpisodeNumber(match[kEpisode].str()),
                         trim(match[kTags].str()),
                         toLower(match[kExtension].str()),
                         filePath.string()};
}

std::string EpisodeParser::padEpisodeNumber(std::string digits) {
    if (digits.size() < kMinEpisodeWidth) {
        digits.insert(digits.begin(), kMinEpisodeWidth - digits.size(), '0');
    }
    return digits;
}

std::string EpisodeParser::trim(const std::string& value) {
    std::size_t first = 0;
    std::size_t last = value.size();

    while (first < last) {
        const std::size_t width = whitespaceAt(value, first);
        if (width == 0) {
            break;
        }
        first += width;
    }

    while (last > first) {
        const std::size_t width = whitespaceBefore(value, last);
        if (width == 0 || last - width < first) {
            break;
        }
        last -= width;
    }

    return value.substr(first, last - first);
}

std::string EpisodeParser::toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}
