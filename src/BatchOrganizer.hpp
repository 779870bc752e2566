#ifndef BATCH_ORGANIZER_HPP
#define BATCH_ORGANIZER_HPP

#include "ConfigParser.hpp"
#include "EpisodeParser.hpp"
#include "FileOrganizer.hpp"
#include "TransferError.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

struct BatchSummary {
    // Files whose names parsed and were handed to the organizer.
    std::size_t processed = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    // Allowed extension but unrecognized file name.
    std::size_t skipped = 0;
};

// Walks the source directory and organizes every recognized episode file into the target root.
class BatchOrganizer {
public:
    explicit BatchOrganizer(OrganizerOptions options, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Check that the source directory and the target root exist before anything is touched.
    TransferResult validate() const;
    // Organize every matching file once; individual failures are counted, never fatal.
    BatchSummary organizeAll();
    // Replace the extension allow-list; an empty list restores the built-in defaults.
    void setExtensions(const std::vector<std::string>& extensions);

    const OrganizerOptions& options() const;

private:
    // Regular files under the source directory, sorted so runs are reproducible.
    std::vector<std::filesystem::path> collectCandidates() const;
    bool isIncluded(const std::filesystem::path& file) const;
    void organizeFile(const std::filesystem::path& file, BatchSummary& summary);
    // Normalize extensions (trim whitespace, enforce dot prefix, lower-case).
    static std::string normalizeExtension(std::string extension);

    OrganizerOptions m_options;
    std::unordered_set<std::string> m_extensions;
    std::ostream& m_out;
    std::ostream& m_err;
};

#endif
