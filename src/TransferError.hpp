#ifndef TRANSFER_ERROR_HPP
#define TRANSFER_ERROR_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

enum class TransferErrorKind {
    IoFailure,
    CrossDeviceLink,
    LinkUnsupported,
    SourceNotFound,
    DestinationRootNotFound
};

// A classified failure from one organize attempt or from pre-flight validation.
struct TransferError {
    TransferErrorKind kind = TransferErrorKind::IoFailure;
    // Short verb describing the failed step ("copy", "remove", ...); empty for validation errors.
    std::string operation;
    std::filesystem::path path;
    std::error_code cause;

    static TransferError io(std::string operation, std::filesystem::path path, std::error_code cause);
    static TransferError sourceNotFound(std::filesystem::path path);
    static TransferError destinationRootNotFound(std::filesystem::path path);

    // Link failures a caller may retry with a different operation mode.
    bool allowsFallback() const;
    std::string message() const;
};

// Either success or a TransferError; default-constructed results are successful.
class TransferResult {
public:
    TransferResult() = default;
    TransferResult(TransferError error);

    static TransferResult success();

    bool ok() const;
    explicit operator bool() const;
    // Throws std::bad_optional_access when called on a successful result.
    const TransferError& error() const;

private:
    std::optional<TransferError> m_error;
};

std::string toString(TransferErrorKind kind);

// Map a failed hard-link attempt onto the error taxonomy. Cross-device codes become
// CrossDeviceLink; permission or support failures become LinkUnsupported.
TransferErrorKind classifyLinkError(const std::error_code& ec);

#endif
