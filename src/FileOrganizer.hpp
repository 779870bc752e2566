#ifndef FILE_ORGANIZER_HPP
#define FILE_ORGANIZER_HPP

#include "EpisodeParser.hpp"
#include "TransferError.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

enum class OperationMode {
    Move,
    Copy,
    Link
};

std::string toString(OperationMode mode);
// Accepts `move`, `copy` or `link` in any letter case.
std::optional<OperationMode> parseOperationMode(std::string value);

// Places a parsed episode under `<root>/<title>/<NN [Tags].ext>` by moving, copying or hard-linking it.
// Holds no state; every call is independent.
class FileOrganizer {
public:
    // Full path the record would be written to under destinationRoot.
    static std::filesystem::path destinationFor(const EpisodeRecord& record, const std::filesystem::path& destinationRoot);

    // Transfer one file. With dryRun set, only the intended mapping is written to `report`
    // and the filesystem is left untouched. A failed hard link is classified and returned,
    // never retried with another mode.
    static TransferResult organize(const EpisodeRecord& record,
                                   const std::filesystem::path& destinationRoot,
                                   OperationMode mode,
                                   bool dryRun,
                                   std::ostream& report = std::cout);

private:
    // Create the title folder and clear any entry already occupying the target path.
    static TransferResult prepareDestination(const std::filesystem::path& targetPath);
    // Rename, falling back to copy + remove when the rename is refused (e.g. across devices).
    static TransferResult moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath);
    static TransferResult copyFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath);
    static TransferResult linkFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath);
};

#endif
