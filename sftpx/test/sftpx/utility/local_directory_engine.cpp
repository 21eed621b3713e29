#include "local_directory_engine.hpp"

#include <fmt/format.h>

#include <array>
#include <fstream>

namespace Sftpx::Test
{
    SftpError statusError(SftpStatus status, std::string message)
    {
        return SftpError{
            .message = std::move(message),
            .sshError = 0,
            .sftpError = static_cast<int>(status),
        };
    }

    namespace
    {
        FileType typeOf(std::filesystem::file_status const& status)
        {
            switch (status.type())
            {
                case std::filesystem::file_type::regular:
                    return FileType::Regular;
                case std::filesystem::file_type::directory:
                    return FileType::Directory;
                case std::filesystem::file_type::symlink:
                    return FileType::Symlink;
                default:
                    return FileType::Special;
            }
        }

        std::expected<void, SftpError> notConnected()
        {
            return std::unexpected(SftpError{.message = "Not connected", .wrapperError = WrapperErrors::NotConnected});
        }
    }

    class LocalDirectoryEngine::CallScope
    {
      public:
        explicit CallScope(LocalDirectoryEngine& engine)
            : engine_{engine}
        {
            const auto current = ++engine_.inFlight_;
            std::scoped_lock lock{engine_.journalMutex_};
            if (current > engine_.journal_->maxConcurrentCalls)
                engine_.journal_->maxConcurrentCalls = current;
        }
        ~CallScope()
        {
            --engine_.inFlight_;
        }

      private:
        LocalDirectoryEngine& engine_;
    };

    LocalDirectoryEngine::LocalDirectoryEngine(std::filesystem::path root, std::shared_ptr<Journal> journal)
        : root_{std::move(root)}
        , journal_{journal ? std::move(journal) : std::make_shared<Journal>()}
    {}

    void LocalDirectoryEngine::record(std::string call)
    {
        std::scoped_lock lock{journalMutex_};
        journal_->calls.push_back(std::move(call));
    }

    std::filesystem::path LocalDirectoryEngine::map(std::string const& remote) const
    {
        auto relative = std::filesystem::path{remote}.relative_path();
        if (relative.empty())
            return root_;
        return root_ / relative;
    }

    std::optional<SftpError> LocalDirectoryEngine::denied(std::string const& remote) const
    {
        if (denied_.contains(remote))
            return statusError(SftpStatus::PermissionDenied, "Permission denied");
        return std::nullopt;
    }

    void LocalDirectoryEngine::denyAccessTo(std::string const& remote)
    {
        denied_.insert(remote);
    }

    void LocalDirectoryEngine::raceDirectoryCreation(std::string const& remote)
    {
        racing_.insert(remote);
    }

    std::expected<void, SftpError> LocalDirectoryEngine::connect(SessionOptions const& options)
    {
        CallScope scope{*this};
        record("connect");
        if (options.password && *options.password == rejectedPassword)
        {
            return std::unexpected(SftpError{
                .message = "Access denied",
                .wrapperError = WrapperErrors::AuthenticationFailed,
            });
        }
        connected_ = true;
        return {};
    }

    void LocalDirectoryEngine::closeFileOperations()
    {
        record("closeFileOperations");
    }

    void LocalDirectoryEngine::disconnect()
    {
        record("disconnect");
        connected_ = false;
    }

    bool LocalDirectoryEngine::isConnected() const
    {
        return connected_;
    }

    std::expected<void, SftpError> LocalDirectoryEngine::upload(
        std::filesystem::path const& local,
        std::string const& remote,
        ProgressCallback const& progress)
    {
        CallScope scope{*this};
        record("upload " + remote);
        if (!connected_)
            return notConnected();
        if (auto error = denied(remote))
            return std::unexpected(*error);

        const auto target = map(remote);
        if (!std::filesystem::is_directory(target.parent_path()))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such file: {}", remote)));

        std::ifstream reader{local, std::ios_base::binary};
        std::ofstream writer{target, std::ios_base::binary | std::ios_base::trunc};
        if (!reader || !writer)
            return std::unexpected(statusError(SftpStatus::Failure, "Cannot open file"));

        const auto total = std::filesystem::file_size(local);
        std::array<char, chunkSize> buffer{};
        std::uint64_t transferred = 0;
        while (reader.read(buffer.data(), buffer.size()) || reader.gcount() > 0)
        {
            writer.write(buffer.data(), reader.gcount());
            transferred += static_cast<std::uint64_t>(reader.gcount());
            if (progress)
                progress(transferred, total);
        }
        return {};
    }

    std::expected<void, SftpError> LocalDirectoryEngine::download(
        std::string const& remote,
        std::filesystem::path const& local,
        ProgressCallback const& progress)
    {
        CallScope scope{*this};
        record("download " + remote);
        if (!connected_)
            return notConnected();
        if (auto error = denied(remote))
            return std::unexpected(*error);

        const auto source = map(remote);
        if (!std::filesystem::is_regular_file(source))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such file: {}", remote)));

        std::ifstream reader{source, std::ios_base::binary};
        std::ofstream writer{local, std::ios_base::binary | std::ios_base::trunc};
        if (!writer)
        {
            return std::unexpected(SftpError{
                .message = fmt::format("Cannot open '{}' for writing", local.string()),
                .wrapperError = WrapperErrors::LocalFileError,
            });
        }

        const auto total = std::filesystem::file_size(source);
        std::array<char, chunkSize> buffer{};
        std::uint64_t transferred = 0;
        while (reader.read(buffer.data(), buffer.size()) || reader.gcount() > 0)
        {
            writer.write(buffer.data(), reader.gcount());
            transferred += static_cast<std::uint64_t>(reader.gcount());
            if (progress)
                progress(transferred, total);
        }
        return {};
    }

    std::expected<std::vector<FileInformation>, SftpError> LocalDirectoryEngine::listDirectory(std::string const& path)
    {
        CallScope scope{*this};
        record("listDirectory " + path);
        if (!connected_)
            return std::unexpected(notConnected().error());
        if (auto error = denied(path))
            return std::unexpected(*error);

        const auto directory = map(path);
        if (!std::filesystem::is_directory(directory))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such directory: {}", path)));

        std::vector<FileInformation> entries{};
        for (auto const& dirEntry : std::filesystem::directory_iterator{directory})
        {
            const auto status = dirEntry.symlink_status();
            entries.push_back(FileInformation{
                .path = dirEntry.path().filename(),
                .type = typeOf(status),
                .size = status.type() == std::filesystem::file_type::regular ? dirEntry.file_size() : 0,
                .permissions = status.permissions(),
            });
        }
        return entries;
    }

    std::expected<FileInformation, SftpError> LocalDirectoryEngine::stat(std::string const& path)
    {
        CallScope scope{*this};
        record("stat " + path);
        if (!connected_)
            return std::unexpected(notConnected().error());
        if (auto error = denied(path))
            return std::unexpected(*error);

        std::error_code ec{};
        const auto target = map(path);
        const auto status = std::filesystem::status(target, ec);
        if (ec || !std::filesystem::exists(status))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such file: {}", path)));

        return FileInformation{
            .path = path,
            .type = typeOf(status),
            .size = status.type() == std::filesystem::file_type::regular ? std::filesystem::file_size(target) : 0,
            .permissions = status.permissions(),
        };
    }

    std::expected<void, SftpError> LocalDirectoryEngine::createDirectory(std::string const& path, std::uint32_t mode)
    {
        CallScope scope{*this};
        record("createDirectory " + path);
        if (!connected_)
            return notConnected();
        if (auto error = denied(path))
            return std::unexpected(*error);

        const auto target = map(path);
        if (racing_.erase(path) > 0)
        {
            std::filesystem::create_directory(target);
            return std::unexpected(statusError(SftpStatus::Failure, "Failure"));
        }
        if (std::filesystem::exists(target))
            return std::unexpected(statusError(SftpStatus::Failure, fmt::format("'{}' already exists", path)));
        if (!std::filesystem::is_directory(target.parent_path()))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such file: {}", path)));

        std::filesystem::create_directory(target);
        std::scoped_lock lock{journalMutex_};
        journal_->createdDirectories[path] = mode;
        return {};
    }

    std::expected<void, SftpError> LocalDirectoryEngine::removeDirectory(std::string const& path)
    {
        CallScope scope{*this};
        record("removeDirectory " + path);
        if (!connected_)
            return notConnected();
        if (auto error = denied(path))
            return std::unexpected(*error);

        const auto target = map(path);
        if (!std::filesystem::is_directory(target))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such directory: {}", path)));
        if (!std::filesystem::is_empty(target))
            return std::unexpected(statusError(SftpStatus::Failure, fmt::format("'{}' is not empty", path)));

        std::filesystem::remove(target);
        return {};
    }

    std::expected<void, SftpError> LocalDirectoryEngine::removeFile(std::string const& path)
    {
        CallScope scope{*this};
        record("removeFile " + path);
        if (!connected_)
            return notConnected();
        if (auto error = denied(path))
            return std::unexpected(*error);

        const auto target = map(path);
        if (!std::filesystem::is_regular_file(std::filesystem::symlink_status(target)))
            return std::unexpected(statusError(SftpStatus::NoSuchFile, fmt::format("No such file: {}", path)));

        std::filesystem::remove(target);
        return {};
    }
}
