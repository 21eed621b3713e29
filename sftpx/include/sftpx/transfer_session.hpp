#pragma once

#include <sftpx/async/processing_strand.hpp>
#include <sftpx/async/worker_pool.hpp>
#include <sftpx/error.hpp>
#include <sftpx/file_information.hpp>
#include <sftpx/session_options.hpp>
#include <sftpx/transport_engine.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Sftpx
{
    /**
     * @brief One connection to an SFTP server and the file operations on top of it.
     *
     * Every operation returns a future immediately and runs on a worker thread. The operations of one session are
     * executed one after another in the order they were issued, different sessions run in parallel.
     * Remote paths are converted to forward slash form before they are used.
     */
    class TransferSession
    {
      public:
        enum class State
        {
            Unconnected,
            Connected,
            Closed
        };

        static constexpr std::uint32_t defaultDirectoryMode = 0777;

        /**
         * @brief Construct a new session. Does not connect.
         *
         * @param options Connection parameters, kept for the lifetime of the session.
         * @param engine The blocking implementation to delegate to.
         * @param pool The workers to run on. Must outlive the session.
         */
        TransferSession(
            SessionOptions options,
            std::unique_ptr<TransportEngine> engine,
            Async::WorkerPool& pool = Async::defaultWorkerPool());
        ~TransferSession();
        TransferSession(TransferSession const&) = delete;
        TransferSession& operator=(TransferSession const&) = delete;
        TransferSession(TransferSession&&) = delete;
        TransferSession& operator=(TransferSession&&) = delete;

        /**
         * @brief Connects and authenticates. A session can only be connected once, also after close.
         */
        std::future<std::expected<void, Error>> connect();

        /**
         * @brief Closes the file operations channel, then the transport. Operations issued before still complete.
         * Calling it again, or on a session that never connected, is harmless.
         */
        std::future<void> close();

        std::future<std::expected<void, Error>>
        put(std::filesystem::path const& local, std::filesystem::path const& remote, ProgressCallback progress = {});

        std::future<std::expected<void, Error>>
        get(std::filesystem::path const& remote, std::filesystem::path const& local, ProgressCallback progress = {});

        /**
         * @brief Names of the entries of a remote directory, without "." and "..".
         */
        std::future<std::expected<std::vector<std::string>, Error>>
        listDirectory(std::filesystem::path const& path = ".");

        /**
         * @brief Creates a single directory level. Fails if it exists already.
         */
        std::future<std::expected<void, Error>>
        createDirectory(std::filesystem::path const& path, std::uint32_t mode = defaultDirectoryMode);

        std::future<std::expected<void, Error>> removeDirectory(std::filesystem::path const& path);
        std::future<std::expected<void, Error>> removeFile(std::filesystem::path const& path);

        /**
         * @brief False if the server reports that the path does not exist. Any other failure is an error.
         */
        std::future<std::expected<bool, Error>> exists(std::filesystem::path const& path);

        std::future<std::expected<FileInformation, Error>> stat(std::filesystem::path const& path);

        /**
         * @brief True if the path is a directory or a symlink to one. False if it does not exist.
         */
        std::future<std::expected<bool, Error>> isDirectory(std::filesystem::path const& path);

        /**
         * @brief Uploads every regular file below localRoot, recreating the directory structure below remoteRoot.
         * Missing remote directories are created, existing ones are reused. The progress callback is handed to every
         * single file upload. Files uploaded before a failure stay on the server.
         */
        std::future<std::expected<void, Error>> putDirectory(
            std::filesystem::path const& localRoot,
            std::filesystem::path const& remoteRoot,
            ProgressCallback progress = {});

        /**
         * @brief Downloads a remote directory tree into localRoot, which is created if necessary.
         * Files downloaded before a failure are kept.
         */
        std::future<std::expected<void, Error>> getDirectory(
            std::filesystem::path const& remoteRoot,
            std::filesystem::path const& localRoot,
            ProgressCallback progress = {});

        State state() const noexcept;
        bool isConnected() const noexcept;
        SessionOptions const& options() const noexcept;

      private:
        template <typename T, typename FunctionT>
        std::future<std::expected<T, Error>> perform(std::string_view operation, FunctionT&& func);

        template <typename T>
        static std::future<std::expected<T, Error>> readyFailure(Error error);

        std::expected<void, Error> doConnect();
        void doClose();
        std::expected<void, Error>
        doPut(std::filesystem::path const& local, std::string const& remote, ProgressCallback const& progress);
        std::expected<void, Error>
        doGet(std::string const& remote, std::filesystem::path const& local, ProgressCallback const& progress);
        std::expected<FileInformation, SftpError> doStat(std::string const& path);
        std::expected<bool, SftpError> probeDirectory(std::string const& path);
        std::expected<void, Error> ensureRemoteDirectories(std::string const& directory, std::set<std::string>& ensured);
        std::expected<void, Error> doPutDirectory(
            std::filesystem::path const& localRoot,
            std::string const& remoteRoot,
            ProgressCallback const& progress);
        std::expected<void, Error> doGetDirectory(
            std::string const& remoteRoot,
            std::filesystem::path const& localRoot,
            ProgressCallback const& progress);

      private:
        SessionOptions const options_;
        std::unique_ptr<TransportEngine> engine_;
        mutable std::mutex lifecycleMutex_{};
        std::atomic<State> state_{State::Unconnected};
        std::promise<void> closedPromise_{};
        std::shared_future<void> closed_;
        Async::ProcessingStrand strand_;
    };

    std::string_view sessionStateToString(TransferSession::State state);
}
