#include "TransferError.hpp"

#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

TransferError TransferError::io(std::string operation, std::filesystem::path path, std::error_code cause) {
    TransferError error;
    error.kind = TransferErrorKind::IoFailure;
    error.operation = std::move(operation);
    error.path = std::move(path);
    error.cause = cause;
    return error;
}

TransferError TransferError::sourceNotFound(std::filesystem::path path) {
    TransferError error;
    error.kind = TransferErrorKind::SourceNotFound;
    error.path = std::move(path);
    return error;
}

TransferError TransferError::destinationRootNotFound(std::filesystem::path path) {
    TransferError error;
    error.kind = TransferErrorKind::DestinationRootNotFound;
    error.path = std::move(path);
    return error;
}

bool TransferError::allowsFallback() const {
    return kind == TransferErrorKind::CrossDeviceLink || kind == TransferErrorKind::LinkUnsupported;
}

std::string TransferError::message() const {
    switch (kind) {
    case TransferErrorKind::CrossDeviceLink:
        return "Hard link failed: source and destination must be on the same filesystem";
    case TransferErrorKind::LinkUnsupported:
        return "Hard links are not supported for `" + path.string() + "`" +
               (cause ? ": " + cause.message() : std::string{});
    case TransferErrorKind::SourceNotFound:
        return "Source directory does not exist: `" + path.string() + "`";
    case TransferErrorKind::DestinationRootNotFound:
        return "Target directory does not exist: `" + path.string() + "`";
    case TransferErrorKind::IoFailure:
        break;
    }

    std::string text = "Failed to " + (operation.empty() ? std::string("access") : operation) + " `" +
                       path.string() + "`";
    if (cause) {
        text += ": " + cause.message();
    }
    return text;
}

TransferResult::TransferResult(TransferError error) : m_error(std::move(error)) {}

TransferResult TransferResult::success() {
    return TransferResult{};
}

bool TransferResult::ok() const {
    return !m_error.has_value();
}

TransferResult::operator bool() const {
    return ok();
}

const TransferError& TransferResult::error() const {
    return m_error.value();
}

std::string toString(TransferErrorKind kind) {
    switch (kind) {
    case TransferErrorKind::IoFailure:
        return "io-failure";
    case TransferErrorKind::CrossDeviceLink:
        return "cross-device-link";
    case TransferErrorKind::LinkUnsupported:
        return "link-unsupported";
    case TransferErrorKind::SourceNotFound:
        return "source-not-found";
    case TransferErrorKind::DestinationRootNotFound:
        return "destination-root-not-found";
    }
    return "unknown";
}

TransferErrorKind classifyLinkError(const std::error_code& ec) {
#ifdef _WIN32
    if (ec.category() == std::system_category() && ec.value() == ERROR_NOT_SAME_DEVICE) {
        return TransferErrorKind::CrossDeviceLink;
    }
#endif

    if (ec == std::errc::cross_device_link) {
        return TransferErrorKind::CrossDeviceLink;
    }

    // Permission failures are treated as "no hard link support"; this is an approximation
    // since unrelated ACL restrictions surface the same way.
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::not_supported || ec == std::errc::operation_not_supported) {
        return TransferErrorKind::LinkUnsupported;
    }

    return TransferErrorKind::IoFailure;
}
