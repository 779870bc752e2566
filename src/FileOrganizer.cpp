#include "FileOrganizer.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

std::string toString(OperationMode mode) {
    switch (mode) {
    case OperationMode::Move:
        return "move";
    case OperationMode::Copy:
        return "copy";
    case OperationMode::Link:
        return "link";
    }
    return "unknown";
}

std::optional<OperationMode> parseOperationMode(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (value == "move") {
        return OperationMode::Move;
    }
    if (value == "copy") {
        return OperationMode::Copy;
    }
    if (value == "link") {
        return OperationMode::Link;
    }
    return std::nullopt;
}

std::filesystem::path FileOrganizer::destinationFor(const EpisodeRecord& record, const std::filesystem::path& destinationRoot) {
    return destinationRoot / record.title / record.targetFileName();
}

TransferResult FileOrganizer::organize(const EpisodeRecord& record,
                                       const std::filesystem::path& destinationRoot,
                                       OperationMode mode,
                                       bool dryRun,
                                       std::ostream& report) {
    const std::filesystem::path sourcePath(record.sourcePath);
    const std::filesystem::path targetPath = destinationFor(record, destinationRoot);

    if (dryRun) {
        report << "[DRY-RUN] " << record.sourcePath << " -> " << targetPath.string() << std::endl;
        return TransferResult::success();
    }

    TransferResult prepared = prepareDestination(targetPath);
    if (!prepared) {
        return prepared;
    }

    switch (mode) {
    case OperationMode::Move:
        return moveFile(sourcePath, targetPath);
    case OperationMode::Copy:
        return copyFile(sourcePath, targetPath);
    case OperationMode::Link:
        return linkFile(sourcePath, targetPath);
    }

    return TransferError::io("organize", sourcePath, std::make_error_code(std::errc::invalid_argument));
}

TransferResult FileOrganizer::prepareDestination(const std::filesystem::path& targetPath) {
    const std::filesystem::path titleFolder = targetPath.parent_path();

    std::error_code mkdirErr;
    std::filesystem::create_directories(titleFolder, mkdirErr);
    if (mkdirErr) {
        return TransferError::io("create directory", titleFolder, mkdirErr);
    }

    // Look at the entry itself so a dangling symlink in the way is cleared too.
    std::error_code statusErr;
    const auto status = std::filesystem::symlink_status(targetPath, statusErr);
    if (statusErr && statusErr != std::errc::no_such_file_or_directory) {
        return TransferError::io("inspect", targetPath, statusErr);
    }

    if (std::filesystem::exists(status)) {
        std::error_code removeErr;
        std::filesystem::remove(targetPath, removeErr);
        if (removeErr) {
            return TransferError::io("remove existing", targetPath, removeErr);
        }
    }

    return TransferResult::success();
}

TransferResult FileOrganizer::moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) {
    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        return TransferResult::success();
    }

    // Rename cannot cross devices; copy the contents over and drop the original instead.
    std::error_code copyErr;
    std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::overwrite_existing, copyErr);
    if (copyErr) {
        return TransferError::io("copy", sourcePath, copyErr);
    }

    std::error_code removeErr;
    std::filesystem::remove(sourcePath, removeErr);
    if (removeErr) {
        // The copy is already in place, so the caller sees both files.
        return TransferError::io("remove original", sourcePath, removeErr);
    }

    return TransferResult::success();
}

TransferResult FileOrganizer::copyFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) {
    std::error_code copyErr;
    std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::overwrite_existing, copyErr);
    if (copyErr) {
        return TransferError::io("copy", sourcePath, copyErr);
    }
    return TransferResult::success();
}

TransferResult FileOrganizer::linkFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath) {
    std::error_code linkErr;
    std::filesystem::create_hard_link(sourcePath, targetPath, linkErr);
    if (!linkErr) {
        return TransferResult::success();
    }

    const TransferErrorKind kind = classifyLinkError(linkErr);
    if (kind == TransferErrorKind::IoFailure) {
        return TransferError::io("hard link", sourcePath, linkErr);
    }

    TransferError error;
    error.kind = kind;
    error.operation = "hard link";
    error.path = sourcePath;
    error.cause = linkErr;
    return error;
}
