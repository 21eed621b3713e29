#include <sftpx/transfer_session.hpp>
#include <sftpx/local_enumerator.hpp>
#include <sftpx/remote_path.hpp>

#include <utility/directory_traversal.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace Sftpx
{
    namespace
    {
        Error metadataError(std::string_view what, SftpError cause)
        {
            return wrapError(
                cause.isPermissionDenied() ? ErrorKind::Permission : ErrorKind::Generic, what, std::move(cause));
        }

        Error transferError(std::string message, Error const& cause)
        {
            auto error = makeError(ErrorKind::FileTransfer, fmt::format("{}: {}", message, cause.message), cause.cause);
            error.code = cause.code;
            return error;
        }
    }

    std::string_view sessionStateToString(TransferSession::State state)
    {
        switch (state)
        {
            case TransferSession::State::Unconnected:
                return "unconnected";
            case TransferSession::State::Connected:
                return "connected";
            case TransferSession::State::Closed:
                return "closed";
        }
        return "unknown";
    }

    TransferSession::TransferSession(
        SessionOptions options,
        std::unique_ptr<TransportEngine> engine,
        Async::WorkerPool& pool)
        : options_{std::move(options)}
        , engine_{std::move(engine)}
        , closed_{closedPromise_.get_future().share()}
        , strand_{pool}
    {
        if (!engine_)
            throw std::invalid_argument("A transfer session needs a transport engine.");
    }

    TransferSession::~TransferSession()
    {
        // Discarding the future does not block, waiting for closed_ makes sure no task still refers to this.
        close();
        closed_.wait();
    }

    TransferSession::State TransferSession::state() const noexcept
    {
        return state_.load();
    }

    bool TransferSession::isConnected() const noexcept
    {
        return state_.load() == State::Connected;
    }

    SessionOptions const& TransferSession::options() const noexcept
    {
        return options_;
    }

    template <typename T>
    std::future<std::expected<T, Error>> TransferSession::readyFailure(Error error)
    {
        std::promise<std::expected<T, Error>> promise{};
        promise.set_value(std::unexpected(std::move(error)));
        return promise.get_future();
    }

    template <typename T, typename FunctionT>
    std::future<std::expected<T, Error>> TransferSession::perform(std::string_view operation, FunctionT&& func)
    {
        std::scoped_lock lock{lifecycleMutex_};
        if (state_.load() != State::Connected)
        {
            Log::error(
                "Cannot {} with session to '{}', the session is {}.",
                operation,
                options_.host,
                sessionStateToString(state_.load()));
            return readyFailure<T>(
                makeError(ErrorKind::NotConnected, fmt::format("Cannot {}: session is not connected", operation)));
        }

        return strand_.pushPromiseTask(
            [this, operation, func = std::forward<FunctionT>(func)]() mutable -> std::expected<T, Error> {
                std::expected<T, Error> result = std::unexpected(Error{});
                try
                {
                    result = func();
                }
                catch (std::exception const& exc)
                {
                    result =
                        std::unexpected(makeError(ErrorKind::Generic, fmt::format("Failed to {}: {}", operation, exc.what())));
                }

                if (!result)
                    Log::error("Session to '{}': {}", options_.host, result.error().toString());
                return result;
            });
    }

    std::future<std::expected<void, Error>> TransferSession::connect()
    {
        std::scoped_lock lock{lifecycleMutex_};
        switch (state_.load())
        {
            case State::Closed:
                Log::error("Cannot connect to '{}', the session is closed.", options_.host);
                return readyFailure<void>(
                    makeError(ErrorKind::InvalidState, "Session is closed and cannot be connected again"));
            case State::Connected:
                return readyFailure<void>(makeError(ErrorKind::InvalidState, "Session is already connected"));
            default:
                break;
        }

        return strand_.pushPromiseTask([this]() {
            return doConnect();
        });
    }

    std::expected<void, Error> TransferSession::doConnect()
    {
        // Another connect may have been queued before this one.
        switch (state_.load())
        {
            case State::Closed:
                return std::unexpected(
                    makeError(ErrorKind::InvalidState, "Session is closed and cannot be connected again"));
            case State::Connected:
                return std::unexpected(makeError(ErrorKind::InvalidState, "Session is already connected"));
            default:
                break;
        }

        if (auto valid = options_.validate(); !valid)
        {
            Log::error("Invalid options for session to '{}': {}", options_.host, valid.error());
            return std::unexpected(
                makeError(ErrorKind::Generic, fmt::format("Failed to establish SFTP connection: {}", valid.error())));
        }

        Log::info("Connecting to {}@{}:{}.", options_.user, options_.host, options_.port);

        std::expected<void, SftpError> result{};
        try
        {
            result = engine_->connect(options_);
        }
        catch (std::exception const& exc)
        {
            Log::error("Connecting to '{}' failed: {}", options_.host, exc.what());
            return std::unexpected(
                makeError(ErrorKind::Generic, fmt::format("Failed to establish SFTP connection: {}", exc.what())));
        }

        if (!result)
        {
            auto error = result.error().isAuthenticationFailure()
                ? wrapError(ErrorKind::Authentication, "Authentication failed", std::move(result).error())
                : wrapError(ErrorKind::Connection, "SSH connection failed", std::move(result).error());
            Log::error("Connecting to '{}' failed: {}", options_.host, error.toString());
            return std::unexpected(std::move(error));
        }

        auto expected = State::Unconnected;
        if (!state_.compare_exchange_strong(expected, State::Connected))
        {
            // The queued close task disconnects the engine again.
            return std::unexpected(makeError(ErrorKind::InvalidState, "Session was closed while connecting"));
        }

        Log::info("Connected to {}@{}:{}.", options_.user, options_.host, options_.port);
        return {};
    }

    std::future<void> TransferSession::close()
    {
        std::scoped_lock lock{lifecycleMutex_};
        if (strand_.isFinalized())
        {
            std::promise<void> promise{};
            promise.set_value();
            return promise.get_future();
        }

        state_.store(State::Closed);
        return strand_.pushFinalPromiseTask([this]() {
            doClose();
        });
    }

    void TransferSession::doClose()
    {
        try
        {
            engine_->closeFileOperations();
            engine_->disconnect();
            Log::info("Closed session to '{}'.", options_.host);
        }
        catch (std::exception const& exc)
        {
            Log::error("Error while closing session to '{}': {}", options_.host, exc.what());
        }
        closedPromise_.set_value();
    }

    std::future<std::expected<void, Error>> TransferSession::put(
        std::filesystem::path const& local,
        std::filesystem::path const& remote,
        ProgressCallback progress)
    {
        return perform<void>(
            "upload file",
            [this, local, remote = normalizeRemotePath(remote), progress = std::move(progress)]() {
                return doPut(local, remote, progress);
            });
    }

    std::future<std::expected<void, Error>> TransferSession::get(
        std::filesystem::path const& remote,
        std::filesystem::path const& local,
        ProgressCallback progress)
    {
        return perform<void>(
            "download file",
            [this, remote = normalizeRemotePath(remote), local, progress = std::move(progress)]() {
                return doGet(remote, local, progress);
            });
    }

    std::future<std::expected<std::vector<std::string>, Error>>
    TransferSession::listDirectory(std::filesystem::path const& path)
    {
        return perform<std::vector<std::string>>(
            "list directory",
            [this, path = normalizeRemotePath(path)]() -> std::expected<std::vector<std::string>, Error> {
                auto entries = engine_->listDirectory(path);
                if (!entries)
                    return std::unexpected(metadataError("Failed to list directory", std::move(entries).error()));

                std::vector<std::string> names{};
                names.reserve(entries->size());
                for (auto const& entry : *entries)
                    names.push_back(entry.path.string());
                return names;
            });
    }

    std::future<std::expected<void, Error>>
    TransferSession::createDirectory(std::filesystem::path const& path, std::uint32_t mode)
    {
        return perform<void>(
            "create directory", [this, path = normalizeRemotePath(path), mode]() -> std::expected<void, Error> {
                if (auto result = engine_->createDirectory(path, mode); !result)
                    return std::unexpected(metadataError("Failed to create directory", std::move(result).error()));
                return {};
            });
    }

    std::future<std::expected<void, Error>> TransferSession::removeDirectory(std::filesystem::path const& path)
    {
        return perform<void>(
            "remove directory", [this, path = normalizeRemotePath(path)]() -> std::expected<void, Error> {
                if (auto result = engine_->removeDirectory(path); !result)
                    return std::unexpected(metadataError("Failed to remove directory", std::move(result).error()));
                return {};
            });
    }

    std::future<std::expected<void, Error>> TransferSession::removeFile(std::filesystem::path const& path)
    {
        return perform<void>("remove file", [this, path = normalizeRemotePath(path)]() -> std::expected<void, Error> {
            if (auto result = engine_->removeFile(path); !result)
                return std::unexpected(metadataError("Failed to remove file", std::move(result).error()));
            return {};
        });
    }

    std::future<std::expected<bool, Error>> TransferSession::exists(std::filesystem::path const& path)
    {
        return perform<bool>(
            "check path existence", [this, path = normalizeRemotePath(path)]() -> std::expected<bool, Error> {
                auto result = doStat(path);
                if (result)
                    return true;
                if (result.error().isNoSuchFile())
                    return false;
                return std::unexpected(metadataError("Failed to check path existence", std::move(result).error()));
            });
    }

    std::future<std::expected<FileInformation, Error>> TransferSession::stat(std::filesystem::path const& path)
    {
        return perform<FileInformation>(
            "get file attributes", [this, path = normalizeRemotePath(path)]() -> std::expected<FileInformation, Error> {
                auto result = doStat(path);
                if (!result)
                    return std::unexpected(metadataError("Failed to get file attributes", std::move(result).error()));
                return std::move(result).value();
            });
    }

    std::future<std::expected<bool, Error>> TransferSession::isDirectory(std::filesystem::path const& path)
    {
        return perform<bool>(
            "check for directory", [this, path = normalizeRemotePath(path)]() -> std::expected<bool, Error> {
                auto result = probeDirectory(path);
                if (!result)
                    return std::unexpected(metadataError("Failed to check for directory", std::move(result).error()));
                return *result;
            });
    }

    std::future<std::expected<void, Error>> TransferSession::putDirectory(
        std::filesystem::path const& localRoot,
        std::filesystem::path const& remoteRoot,
        ProgressCallback progress)
    {
        return perform<void>(
            "upload directory",
            [this, localRoot, remoteRoot = normalizeRemotePath(remoteRoot), progress = std::move(progress)]() {
                return doPutDirectory(localRoot, remoteRoot, progress);
            });
    }

    std::future<std::expected<void, Error>> TransferSession::getDirectory(
        std::filesystem::path const& remoteRoot,
        std::filesystem::path const& localRoot,
        ProgressCallback progress)
    {
        return perform<void>(
            "download directory",
            [this, remoteRoot = normalizeRemotePath(remoteRoot), localRoot, progress = std::move(progress)]() {
                return doGetDirectory(remoteRoot, localRoot, progress);
            });
    }

    std::expected<void, Error> TransferSession::doPut(
        std::filesystem::path const& local,
        std::string const& remote,
        ProgressCallback const& progress)
    {
        std::error_code ec{};
        if (!std::filesystem::is_regular_file(local, ec))
        {
            return std::unexpected(makeLocalError(
                ErrorKind::NotFound,
                std::errc::no_such_file_or_directory,
                fmt::format("Local file not found: {}", local.string())));
        }

        if (auto result = engine_->upload(local, remote, progress); !result)
            return std::unexpected(wrapError(ErrorKind::FileTransfer, "Failed to upload file", std::move(result).error()));
        return {};
    }

    std::expected<void, Error> TransferSession::doGet(
        std::string const& remote,
        std::filesystem::path const& local,
        ProgressCallback const& progress)
    {
        if (auto result = engine_->download(remote, local, progress); !result)
        {
            return std::unexpected(
                wrapError(ErrorKind::FileTransfer, "Failed to download file", std::move(result).error()));
        }
        return {};
    }

    std::expected<FileInformation, SftpError> TransferSession::doStat(std::string const& path)
    {
        return engine_->stat(path);
    }

    std::expected<bool, SftpError> TransferSession::probeDirectory(std::string const& path)
    {
        auto result = doStat(path);
        if (!result)
        {
            if (result.error().isNoSuchFile())
                return false;
            return std::unexpected(std::move(result).error());
        }
        return result->isDirectory();
    }

    std::expected<void, Error>
    TransferSession::ensureRemoteDirectories(std::string const& directory, std::set<std::string>& ensured)
    {
        for (auto const& segment : remotePathSegments(directory))
        {
            if (ensured.contains(segment))
                continue;

            auto isDirectory = probeDirectory(segment);
            if (!isDirectory)
            {
                return std::unexpected(wrapError(
                    ErrorKind::FileTransfer,
                    fmt::format("Failed to create remote directory '{}'", segment),
                    std::move(isDirectory).error()));
            }

            if (!*isDirectory)
            {
                auto created = engine_->createDirectory(segment, defaultDirectoryMode);
                if (!created)
                {
                    // Someone else may have created it in the meantime.
                    auto recheck = probeDirectory(segment);
                    if (!recheck || !*recheck)
                    {
                        return std::unexpected(wrapError(
                            ErrorKind::FileTransfer,
                            fmt::format("Failed to create remote directory '{}'", segment),
                            std::move(created).error()));
                    }
                }
                Log::debug("Created remote directory '{}'.", segment);
            }
            ensured.insert(segment);
        }
        return {};
    }

    std::expected<void, Error> TransferSession::doPutDirectory(
        std::filesystem::path const& localRoot,
        std::string const& remoteRoot,
        ProgressCallback const& progress)
    {
        std::error_code ec{};
        if (!std::filesystem::is_directory(localRoot, ec))
        {
            return std::unexpected(makeLocalError(
                ErrorKind::NotADirectory,
                std::errc::not_a_directory,
                fmt::format("Local path is not a directory: {}", localRoot.string())));
        }

        auto files = enumerateLocalFiles(localRoot);
        if (!files)
            return std::unexpected(transferError("Failed to upload directory", files.error()));

        std::set<std::string> ensured{};
        for (auto const& file : *files)
        {
            // Only the host's own separators delimit segments of a local name.
            const auto relative = file.lexically_relative(localRoot).generic_string();
            const auto remoteFile = joinRemotePath(remoteRoot, relative);

            if (const auto parent = remoteParentPath(remoteFile); !parent.empty())
            {
                if (auto result = ensureRemoteDirectories(parent, ensured); !result)
                    return std::unexpected(std::move(result).error());
            }

            Log::debug("Uploading '{}' to '{}'.", file.string(), remoteFile);
            if (auto result = doPut(file, remoteFile, progress); !result)
            {
                return std::unexpected(
                    transferError(fmt::format("Failed to upload '{}'", file.string()), result.error()));
            }
        }
        Log::info("Uploaded {} files from '{}' to '{}'.", files->size(), localRoot.string(), remoteRoot);
        return {};
    }

    std::expected<void, Error> TransferSession::doGetDirectory(
        std::string const& remoteRoot,
        std::filesystem::path const& localRoot,
        ProgressCallback const& progress)
    {
        std::error_code ec{};
        std::filesystem::create_directories(localRoot, ec);
        if (ec)
        {
            auto error = makeError(
                ErrorKind::FileTransfer,
                fmt::format("Failed to create local directory '{}': {}", localRoot.string(), ec.message()));
            error.code = ec;
            return std::unexpected(std::move(error));
        }

        auto scanner = [this](std::filesystem::path const& directory)
            -> std::expected<std::vector<FileInformation>, SftpError> {
            // Walk paths are built from names the server returned, a '\\' in them is part of the name.
            const auto remoteDirectory = directory.generic_string();
            auto entries = engine_->listDirectory(remoteDirectory);
            if (!entries)
                return std::unexpected(std::move(entries).error());

            for (auto& entry : *entries)
            {
                if (entry.isDirectory() || entry.isRegularFile())
                    continue;

                // Links and entries without type information: ask for what they point to.
                auto resolved = doStat(joinRemotePath(remoteDirectory, entry.path.string()));
                if (!resolved)
                    return std::unexpected(std::move(resolved).error());
                entry.type = resolved->type;
                entry.size = resolved->size;
            }
            return std::move(entries).value();
        };

        Utility::DeepDirectoryWalker<FileInformation, SftpError, decltype(scanner)> walker{
            std::filesystem::path{remoteRoot}, std::move(scanner)};

        std::size_t downloaded = 0;
        while (!walker.done())
        {
            auto discovered = walker.step();
            if (!discovered)
            {
                const auto failed = walker.pending() ? walker.fullPath(*walker.pending()).generic_string() : remoteRoot;
                return std::unexpected(wrapError(
                    ErrorKind::FileTransfer,
                    fmt::format("Failed to download directory '{}'", failed),
                    std::move(discovered).error()));
            }

            for (auto const& entry : *discovered)
            {
                const auto local = localRoot / walker.relativePath(entry);
                const auto remote = walker.fullPath(entry).generic_string();

                if (entry.isDirectory())
                {
                    std::filesystem::create_directories(local, ec);
                    if (ec)
                    {
                        auto error = makeError(
                            ErrorKind::FileTransfer,
                            fmt::format("Failed to create local directory '{}': {}", local.string(), ec.message()));
                        error.code = ec;
                        return std::unexpected(std::move(error));
                    }
                }
                else if (entry.isRegularFile())
                {
                    Log::debug("Downloading '{}' to '{}'.", remote, local.string());
                    if (auto result = doGet(remote, local, progress); !result)
                    {
                        return std::unexpected(
                            transferError(fmt::format("Failed to download '{}'", remote), result.error()));
                    }
                    ++downloaded;
                }
                else
                {
                    Log::debug("Skipping '{}', it is neither a file nor a directory.", remote);
                }
            }
        }
        Log::info(
            "Downloaded {} files ({} bytes) from '{}' to '{}'.",
            downloaded,
            walker.discoveredBytes(),
            remoteRoot,
            localRoot.string());
        return {};
    }
}
