#pragma once

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace Sftpx
{
    /**
     * @brief Status codes of the SFTP protocol (draft-ietf-secsh-filexfer-02 and later).
     * The numeric values are the ones that travel on the wire and the ones libssh reports via sftp_get_error.
     */
    enum class SftpStatus : int
    {
        Ok = 0,
        Eof = 1,
        NoSuchFile = 2,
        PermissionDenied = 3,
        Failure = 4,
        BadMessage = 5,
        NoConnection = 6,
        ConnectionLost = 7,
        OperationUnsupported = 8,
        InvalidHandle = 9,
        NoSuchPath = 10,
        FileAlreadyExists = 11,
        WriteProtect = 12,
        NoMedia = 13,
    };

    inline std::string_view sftpStatusToString(int status)
    {
        switch (static_cast<SftpStatus>(status))
        {
            case SftpStatus::Ok:
                return "ok";
            case SftpStatus::Eof:
                return "end of file";
            case SftpStatus::NoSuchFile:
                return "no such file";
            case SftpStatus::PermissionDenied:
                return "permission denied";
            case SftpStatus::Failure:
                return "failure";
            case SftpStatus::BadMessage:
                return "bad message";
            case SftpStatus::NoConnection:
                return "no connection";
            case SftpStatus::ConnectionLost:
                return "connection lost";
            case SftpStatus::OperationUnsupported:
                return "operation unsupported";
            case SftpStatus::InvalidHandle:
                return "invalid handle";
            case SftpStatus::NoSuchPath:
                return "no such path";
            case SftpStatus::FileAlreadyExists:
                return "file already exists";
            case SftpStatus::WriteProtect:
                return "write protected";
            case SftpStatus::NoMedia:
                return "no media";
        }
        return "unknown status";
    }

    enum class WrapperErrors
    {
        None,
        NotConnected,
        AuthenticationFailed,
        HostKeyRejected,
        LocalFileError,
        ShortWrite,
        FileNull,
        ConnectionLost,
    };

    /**
     * @brief Error as reported by the transport engine. Carries the raw ssh and sftp codes.
     */
    struct SftpError
    {
        std::string message;
        // Could use a union or variant, but the engine fills whatever it knows:
        int sshError = 0;
        int sftpError = 0;
        WrapperErrors wrapperError = WrapperErrors::None;

        /**
         * @brief Only a status reply of the server says that a path is missing. When the engine reports a failure of
         * its own, a leftover status code must not be read as one.
         */
        bool isNoSuchFile() const
        {
            if (wrapperError != WrapperErrors::None)
                return false;
            return sftpError == static_cast<int>(SftpStatus::NoSuchFile) ||
                sftpError == static_cast<int>(SftpStatus::NoSuchPath);
        }

        bool isPermissionDenied() const
        {
            return wrapperError == WrapperErrors::None && sftpError == static_cast<int>(SftpStatus::PermissionDenied);
        }

        bool isConnectionLost() const
        {
            return wrapperError == WrapperErrors::ConnectionLost;
        }

        bool isAuthenticationFailure() const
        {
            return wrapperError == WrapperErrors::AuthenticationFailed;
        }

        inline std::string toString() const
        {
            return fmt::format(
                "SftpError: message: {}, sshError: {}, sftpError: {} ({}), wrapperError: {}",
                message,
                sshError,
                sftpError,
                sftpStatusToString(sftpError),
                static_cast<int>(wrapperError));
        }
    };
}
