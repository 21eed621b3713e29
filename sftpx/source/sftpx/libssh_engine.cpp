#include <sftpx/libssh_engine.hpp>

#include <log/log.hpp>

#include <fmt/format.h>

#include <fcntl.h>

#include <array>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace Sftpx
{
    namespace
    {
        FileType fileTypeFromAttributes(sftp_attributes attributes)
        {
            if (const auto fromMode = fileTypeFromMode(attributes->permissions); fromMode != FileType::Unknown)
                return fromMode;

            switch (attributes->type)
            {
                case SSH_FILEXFER_TYPE_REGULAR:
                    return FileType::Regular;
                case SSH_FILEXFER_TYPE_DIRECTORY:
                    return FileType::Directory;
                case SSH_FILEXFER_TYPE_SYMLINK:
                    return FileType::Symlink;
                case SSH_FILEXFER_TYPE_SPECIAL:
                    return FileType::Special;
                default:
                    return FileType::Unknown;
            }
        }

        FileInformation fileInformationFromAttributes(sftp_attributes attributes)
        {
            return FileInformation{
                .path = attributes->name ? std::string{attributes->name} : std::string{},
                .type = fileTypeFromAttributes(attributes),
                .size = attributes->size,
                .uid = attributes->uid,
                .gid = attributes->gid,
                .owner = attributes->owner ? std::string{attributes->owner} : std::string{},
                .group = attributes->group ? std::string{attributes->group} : std::string{},
                .permissions = static_cast<std::filesystem::perms>(attributes->permissions) & std::filesystem::perms::mask,
                .atime = attributes->atime,
                .mtime = attributes->mtime,
                .createTime = attributes->createtime,
            };
        }

        using SftpFile = std::unique_ptr<sftp_file_struct, decltype(&sftp_close)>;
        using SftpAttributes = std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)>;

        SftpError wrapperError(WrapperErrors kind, std::string message)
        {
            return SftpError{
                .message = std::move(message),
                .wrapperError = kind,
            };
        }
    }

    LibsshEngine::~LibsshEngine()
    {
        disconnect();
    }

    SftpError LibsshEngine::lastError() const
    {
        if (!session_)
            return wrapperError(WrapperErrors::NotConnected, "Not connected");

        auto* session = session_->getCSession();
        SftpError error{
            .message = ssh_get_error(session),
            .sshError = ssh_get_error_code(session),
        };
        if (!sftp_)
            return error;

        // sftp_get_error keeps the status of the last status reply, it is stale when the transport itself failed.
        if (!ssh_is_connected(session) || error.sshError == SSH_FATAL)
        {
            error.wrapperError = WrapperErrors::ConnectionLost;
            if (error.message.empty())
                error.message = "Connection to the server was lost";
            return error;
        }
        error.sftpError = sftp_get_error(sftp_.get());
        return error;
    }

    std::expected<void, SftpError> LibsshEngine::requireConnection() const
    {
        if (!isConnected())
            return std::unexpected(wrapperError(WrapperErrors::NotConnected, "Not connected"));
        return {};
    }

    std::expected<void, SftpError> LibsshEngine::connect(SessionOptions const& options)
    {
        disconnect();
        session_ = std::make_unique<ssh::Session>();

        auto fail = [this](SftpError error) -> std::expected<void, SftpError> {
            disconnect();
            return std::unexpected(std::move(error));
        };

        const auto port = std::to_string(options.port);
        const auto knownHosts = options.knownHostsFile ? options.knownHostsFile->string() : std::string{};
        const std::array<std::pair<char const*, std::function<int()>>, 7> setup{{
            {"host",
             [&] {
                 return session_->setOption(SSH_OPTIONS_HOST, options.host.c_str());
             }},
            {"user",
             [&] {
                 return session_->setOption(SSH_OPTIONS_USER, options.user.c_str());
             }},
            {"port",
             [&] {
                 return session_->setOption(SSH_OPTIONS_PORT_STR, port.c_str());
             }},
            {"timeout",
             [&] {
                 return session_->setOption(SSH_OPTIONS_TIMEOUT, static_cast<long>(options.connectTimeout.count()));
             }},
            {"known hosts file",
             [&] {
                 return knownHosts.empty() ? SSH_OK : session_->setOption(SSH_OPTIONS_KNOWNHOSTS, knownHosts.c_str());
             }},
            {"log verbosity",
             [&] {
                 return options.logVerbosity
                     ? session_->setOption(SSH_OPTIONS_LOG_VERBOSITY_STR, options.logVerbosity->c_str())
                     : SSH_OK;
             }},
            {"connect",
             [&] {
                 return session_->connect();
             }},
        }};

        for (auto const& [step, run] : setup)
        {
            if (run() != SSH_OK)
            {
                Log::error("Setting up the ssh connection to '{}' failed at step '{}'.", options.host, step);
                return fail(lastError());
            }
        }

        if (auto verified = verifyHost(options); !verified)
            return fail(std::move(verified).error());

        if (auto authenticated = authenticate(options); !authenticated)
            return fail(std::move(authenticated).error());

        if (auto opened = openFileOperations(); !opened)
            return fail(std::move(opened).error());

        return {};
    }

    std::expected<void, SftpError> LibsshEngine::verifyHost(SessionOptions const& options)
    {
        switch (ssh_session_is_known_server(session_->getCSession()))
        {
            case SSH_KNOWN_HOSTS_OK:
                return {};
            case SSH_KNOWN_HOSTS_CHANGED:
            case SSH_KNOWN_HOSTS_OTHER:
                return std::unexpected(wrapperError(
                    WrapperErrors::HostKeyRejected,
                    fmt::format("The host key of '{}' does not match the known one", options.host)));
            case SSH_KNOWN_HOSTS_NOT_FOUND:
            case SSH_KNOWN_HOSTS_UNKNOWN:
                if (options.strictHostKeyCheck.value_or(false))
                {
                    return std::unexpected(wrapperError(
                        WrapperErrors::HostKeyRejected, fmt::format("The host '{}' is not known", options.host)));
                }
                Log::warn("Accepting unknown host key of '{}'.", options.host);
                return {};
            case SSH_KNOWN_HOSTS_ERROR:
            default:
                return std::unexpected(lastError());
        }
    }

    std::expected<void, SftpError> LibsshEngine::authenticate(SessionOptions const& options)
    {
        int result = SSH_AUTH_DENIED;
        switch (options.credential())
        {
            case SessionOptions::Credential::Password:
            {
                result = session_->userauthPassword(options.password->c_str());
                break;
            }
            case SessionOptions::Credential::PrivateKey:
            {
                ssh_key key{nullptr};
                const auto keyPath = options.privateKeyPath->string();
                const auto imported = ssh_pki_import_privkey_file(
                    keyPath.c_str(),
                    options.privateKeyPassphrase ? options.privateKeyPassphrase->c_str() : nullptr,
                    nullptr,
                    nullptr,
                    &key);
                if (imported != SSH_OK)
                {
                    return std::unexpected(wrapperError(
                        WrapperErrors::AuthenticationFailed, fmt::format("Cannot load private key '{}'", keyPath)));
                }
                std::unique_ptr<ssh_key_struct, decltype(&ssh_key_free)> keyGuard{key, &ssh_key_free};
                result = session_->userauthPublickey(keyGuard.get());
                break;
            }
            case SessionOptions::Credential::None:
            {
                result = session_->userauthPublickeyAuto();
                break;
            }
        }

        switch (result)
        {
            case SSH_AUTH_SUCCESS:
                return {};
            case SSH_AUTH_ERROR:
                return std::unexpected(lastError());
            case SSH_AUTH_PARTIAL:
                return std::unexpected(
                    wrapperError(WrapperErrors::AuthenticationFailed, "Partial authentication is not supported"));
            case SSH_AUTH_DENIED:
            default:
            {
                auto error = lastError();
                error.wrapperError = WrapperErrors::AuthenticationFailed;
                if (error.message.empty())
                    error.message = "Authentication denied";
                return std::unexpected(std::move(error));
            }
        }
    }

    std::expected<void, SftpError> LibsshEngine::openFileOperations()
    {
        sftp_.reset(sftp_new(session_->getCSession()));
        if (!sftp_)
            return std::unexpected(lastError());

        if (sftp_init(sftp_.get()) != SSH_OK)
        {
            auto error = lastError();
            sftp_.reset();
            return std::unexpected(std::move(error));
        }
        return {};
    }

    void LibsshEngine::closeFileOperations()
    {
        sftp_.reset();
    }

    void LibsshEngine::disconnect()
    {
        closeFileOperations();
        if (!session_)
            return;
        if (ssh_is_connected(session_->getCSession()))
            session_->disconnect();
        session_.reset();
    }

    bool LibsshEngine::isConnected() const
    {
        return session_ && sftp_ && ssh_is_connected(session_->getCSession());
    }

    std::expected<void, SftpError> LibsshEngine::upload(
        std::filesystem::path const& local,
        std::string const& remote,
        ProgressCallback const& progress)
    {
        if (auto connected = requireConnection(); !connected)
            return connected;

        std::ifstream reader{local, std::ios_base::binary};
        if (!reader.good())
        {
            return std::unexpected(
                wrapperError(WrapperErrors::LocalFileError, fmt::format("Cannot open '{}' for reading", local.string())));
        }

        std::error_code ec{};
        const std::uint64_t total = std::filesystem::file_size(local, ec);
        if (ec)
            return std::unexpected(wrapperError(WrapperErrors::LocalFileError, ec.message()));

        SftpFile file{sftp_open(sftp_.get(), remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644), &sftp_close};
        if (!file)
            return std::unexpected(lastError());

        std::array<char, transferChunkSize> buffer{};
        std::uint64_t transferred = 0;
        while (reader)
        {
            reader.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = reader.gcount();
            if (count <= 0)
                break;

            const auto written = sftp_write(file.get(), buffer.data(), static_cast<std::size_t>(count));
            if (written < 0)
                return std::unexpected(lastError());
            if (written != count)
                return std::unexpected(wrapperError(WrapperErrors::ShortWrite, "Short write to remote file"));

            transferred += static_cast<std::uint64_t>(count);
            if (progress)
                progress(transferred, total);
        }
        if (reader.bad())
        {
            return std::unexpected(
                wrapperError(WrapperErrors::LocalFileError, fmt::format("Failed to read '{}'", local.string())));
        }

        if (sftp_close(file.release()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> LibsshEngine::download(
        std::string const& remote,
        std::filesystem::path const& local,
        ProgressCallback const& progress)
    {
        if (auto connected = requireConnection(); !connected)
            return connected;

        SftpFile file{sftp_open(sftp_.get(), remote.c_str(), O_RDONLY, 0), &sftp_close};
        if (!file)
            return std::unexpected(lastError());

        std::uint64_t total = 0;
        if (SftpAttributes attributes{sftp_fstat(file.get()), &sftp_attributes_free}; attributes)
            total = attributes->size;

        std::ofstream writer{local, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
        {
            return std::unexpected(
                wrapperError(WrapperErrors::LocalFileError, fmt::format("Cannot open '{}' for writing", local.string())));
        }

        std::array<char, transferChunkSize> buffer{};
        std::uint64_t transferred = 0;
        for (;;)
        {
            const auto count = sftp_read(file.get(), buffer.data(), buffer.size());
            if (count < 0)
                return std::unexpected(lastError());
            if (count == 0)
                break;

            writer.write(buffer.data(), static_cast<std::streamsize>(count));
            if (!writer)
            {
                return std::unexpected(
                    wrapperError(WrapperErrors::LocalFileError, fmt::format("Failed to write '{}'", local.string())));
            }

            transferred += static_cast<std::uint64_t>(count);
            if (progress)
                progress(transferred, total);
        }
        return {};
    }

    std::expected<std::vector<FileInformation>, SftpError> LibsshEngine::listDirectory(std::string const& path)
    {
        if (auto connected = requireConnection(); !connected)
            return std::unexpected(std::move(connected).error());

        std::vector<FileInformation> entries{};
        int closeResult = SSH_OK;
        {
            std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                sftp_opendir(sftp_.get(), path.c_str()), [&](sftp_dir_struct* dir) {
                    if (dir != nullptr)
                        closeResult = sftp_closedir(dir);
                }};
            if (dir == nullptr)
                return std::unexpected(lastError());

            for (SftpAttributes entry{sftp_readdir(sftp_.get(), dir.get()), &sftp_attributes_free}; entry != nullptr;
                 entry.reset(sftp_readdir(sftp_.get(), dir.get())))
            {
                if (entry->name != nullptr && (std::string_view{entry->name} == "." || std::string_view{entry->name} == ".."))
                    continue;
                entries.push_back(fileInformationFromAttributes(entry.get()));
            }

            if (!sftp_dir_eof(dir.get()))
                return std::unexpected(lastError());
        }
        if (closeResult != SSH_OK)
            return std::unexpected(lastError());

        return entries;
    }

    std::expected<FileInformation, SftpError> LibsshEngine::stat(std::string const& path)
    {
        if (auto connected = requireConnection(); !connected)
            return std::unexpected(std::move(connected).error());

        SftpAttributes attributes{sftp_stat(sftp_.get(), path.c_str()), &sftp_attributes_free};
        if (!attributes)
            return std::unexpected(lastError());

        auto information = fileInformationFromAttributes(attributes.get());
        information.path = path;
        return information;
    }

    std::expected<void, SftpError> LibsshEngine::createDirectory(std::string const& path, std::uint32_t mode)
    {
        if (auto connected = requireConnection(); !connected)
            return connected;

        if (sftp_mkdir(sftp_.get(), path.c_str(), static_cast<mode_t>(mode)) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> LibsshEngine::removeDirectory(std::string const& path)
    {
        if (auto connected = requireConnection(); !connected)
            return connected;

        if (sftp_rmdir(sftp_.get(), path.c_str()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::expected<void, SftpError> LibsshEngine::removeFile(std::string const& path)
    {
        if (auto connected = requireConnection(); !connected)
            return connected;

        if (sftp_unlink(sftp_.get(), path.c_str()) != SSH_OK)
            return std::unexpected(lastError());
        return {};
    }

    std::unique_ptr<TransportEngine> makeLibsshEngine()
    {
        return std::make_unique<LibsshEngine>();
    }

    std::unique_ptr<TransferSession> makeLibsshSession(SessionOptions options, Async::WorkerPool& pool)
    {
        return std::make_unique<TransferSession>(std::move(options), makeLibsshEngine(), pool);
    }
}
