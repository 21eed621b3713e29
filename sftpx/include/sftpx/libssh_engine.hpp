#pragma once

#include <sftpx/async/worker_pool.hpp>
#include <sftpx/transfer_session.hpp>
#include <sftpx/transport_engine.hpp>

#include <libssh/libsshpp.hpp>
#include <libssh/sftp.h>

#include <cstddef>
#include <memory>

namespace Sftpx
{
    /**
     * @brief Transport engine on top of libssh and its sftp subsystem.
     */
    class LibsshEngine : public TransportEngine
    {
      public:
        // Files are moved in pieces of this size, each piece reports progress.
        static constexpr std::size_t transferChunkSize = 32 * 1024;

        LibsshEngine() = default;
        ~LibsshEngine() override;
        LibsshEngine(LibsshEngine const&) = delete;
        LibsshEngine& operator=(LibsshEngine const&) = delete;

        std::expected<void, SftpError> connect(SessionOptions const& options) override;
        void closeFileOperations() override;
        void disconnect() override;
        bool isConnected() const override;

        std::expected<void, SftpError> upload(
            std::filesystem::path const& local,
            std::string const& remote,
            ProgressCallback const& progress) override;
        std::expected<void, SftpError> download(
            std::string const& remote,
            std::filesystem::path const& local,
            ProgressCallback const& progress) override;

        std::expected<std::vector<FileInformation>, SftpError> listDirectory(std::string const& path) override;
        std::expected<FileInformation, SftpError> stat(std::string const& path) override;
        std::expected<void, SftpError> createDirectory(std::string const& path, std::uint32_t mode) override;
        std::expected<void, SftpError> removeDirectory(std::string const& path) override;
        std::expected<void, SftpError> removeFile(std::string const& path) override;

      private:
        SftpError lastError() const;
        std::expected<void, SftpError> requireConnection() const;
        std::expected<void, SftpError> verifyHost(SessionOptions const& options);
        std::expected<void, SftpError> authenticate(SessionOptions const& options);
        std::expected<void, SftpError> openFileOperations();

      private:
        std::unique_ptr<ssh::Session> session_{};
        std::unique_ptr<sftp_session_struct, decltype(&sftp_free)> sftp_{nullptr, &sftp_free};
    };

    std::unique_ptr<TransportEngine> makeLibsshEngine();

    /**
     * @brief Creates a session that talks to a real server through libssh.
     */
    std::unique_ptr<TransferSession>
    makeLibsshSession(SessionOptions options, Async::WorkerPool& pool = Async::defaultWorkerPool());
}
