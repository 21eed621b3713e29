#pragma once

#include <sftpx/sftp_error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace Sftpx
{
    enum class ErrorKind
    {
        // Base failure, used when the cause cannot be classified any further.
        Generic,
        Connection,
        Authentication,
        FileTransfer,
        Permission,

        // Local filesystem preconditions. The code member carries the std::errc.
        NotFound,
        NotADirectory,

        // The session is not in a state that allows the call.
        NotConnected,
        InvalidState,
    };

    std::string_view errorKindToString(ErrorKind kind);

    struct Error
    {
        ErrorKind kind = ErrorKind::Generic;
        std::string message{};
        std::error_code code{};
        std::optional<SftpError> cause{std::nullopt};

        /**
         * @brief True for the remote failure kinds (Generic, Connection, Authentication, FileTransfer, Permission).
         */
        bool isTaxonomyFailure() const;

        /**
         * @brief True for NotFound and NotADirectory, which describe mistakes on the caller side.
         */
        bool isLocalCondition() const;

        std::string toString() const;
    };

    Error makeError(ErrorKind kind, std::string message, std::optional<SftpError> cause = std::nullopt);

    /**
     * @brief Creates an error whose message is "<what>: <cause message>" so the root cause is never lost.
     */
    Error wrapError(ErrorKind kind, std::string_view what, SftpError cause);

    Error makeLocalError(ErrorKind kind, std::errc code, std::string message);
}
