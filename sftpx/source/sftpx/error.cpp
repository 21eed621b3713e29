#include <sftpx/error.hpp>

#include <fmt/format.h>

namespace Sftpx
{
    std::string_view errorKindToString(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::Generic:
                return "SftpxError";
            case ErrorKind::Connection:
                return "ConnectionError";
            case ErrorKind::Authentication:
                return "AuthenticationError";
            case ErrorKind::FileTransfer:
                return "FileTransferError";
            case ErrorKind::Permission:
                return "PermissionError";
            case ErrorKind::NotFound:
                return "NotFound";
            case ErrorKind::NotADirectory:
                return "NotADirectory";
            case ErrorKind::NotConnected:
                return "NotConnected";
            case ErrorKind::InvalidState:
                return "InvalidState";
        }
        return "UnknownError";
    }

    bool Error::isTaxonomyFailure() const
    {
        switch (kind)
        {
            case ErrorKind::Generic:
            case ErrorKind::Connection:
            case ErrorKind::Authentication:
            case ErrorKind::FileTransfer:
            case ErrorKind::Permission:
                return true;
            default:
                return false;
        }
    }

    bool Error::isLocalCondition() const
    {
        return kind == ErrorKind::NotFound || kind == ErrorKind::NotADirectory;
    }

    std::string Error::toString() const
    {
        std::string result = fmt::format("{}: {}", errorKindToString(kind), message);
        if (code)
            result += fmt::format(" [{}]", code.message());
        if (cause)
            result += fmt::format(" ({})", cause->toString());
        return result;
    }

    Error makeError(ErrorKind kind, std::string message, std::optional<SftpError> cause)
    {
        return Error{
            .kind = kind,
            .message = std::move(message),
            .code = {},
            .cause = std::move(cause),
        };
    }

    Error wrapError(ErrorKind kind, std::string_view what, SftpError cause)
    {
        auto message = fmt::format("{}: {}", what, cause.message);
        return makeError(kind, std::move(message), std::move(cause));
    }

    Error makeLocalError(ErrorKind kind, std::errc code, std::string message)
    {
        return Error{
            .kind = kind,
            .message = std::move(message),
            .code = std::make_error_code(code),
            .cause = std::nullopt,
        };
    }
}
