#pragma once

#include <sftpx/file_information.hpp>
#include <sftpx/session_options.hpp>
#include <sftpx/sftp_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace Sftpx
{
    /**
     * @brief Called with (bytes transferred so far, total bytes) while a single file is transferred.
     */
    using ProgressCallback = std::function<void(std::uint64_t transferred, std::uint64_t total)>;

    /**
     * @brief Blocking SSH + SFTP implementation a session delegates to.
     *
     * All functions block the calling thread. An engine is not thread safe, the session guarantees that only one call
     * is in flight at a time. Remote paths are always in forward slash form.
     */
    class TransportEngine
    {
      public:
        virtual ~TransportEngine() = default;

        /**
         * @brief Connects, verifies the host key, authenticates and opens the file operations (sftp) channel.
         * Authentication failures are reported with WrapperErrors::AuthenticationFailed.
         */
        virtual std::expected<void, SftpError> connect(SessionOptions const& options) = 0;

        /**
         * @brief Closes the file operations channel. Does nothing if there is none.
         */
        virtual void closeFileOperations() = 0;

        /**
         * @brief Closes the transport. Does nothing if not connected.
         */
        virtual void disconnect() = 0;

        virtual bool isConnected() const = 0;

        virtual std::expected<void, SftpError>
        upload(std::filesystem::path const& local, std::string const& remote, ProgressCallback const& progress) = 0;

        virtual std::expected<void, SftpError>
        download(std::string const& remote, std::filesystem::path const& local, ProgressCallback const& progress) = 0;

        /**
         * @brief Lists the direct children of a remote directory, without "." and "..".
         * The path member of each entry holds only the entry name.
         */
        virtual std::expected<std::vector<FileInformation>, SftpError> listDirectory(std::string const& path) = 0;

        /**
         * @brief Attributes of a remote path, symlinks are followed.
         */
        virtual std::expected<FileInformation, SftpError> stat(std::string const& path) = 0;

        virtual std::expected<void, SftpError> createDirectory(std::string const& path, std::uint32_t mode) = 0;
        virtual std::expected<void, SftpError> removeDirectory(std::string const& path) = 0;
        virtual std::expected<void, SftpError> removeFile(std::string const& path) = 0;
    };
}
