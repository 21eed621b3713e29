#include <sftpx/session_options.hpp>

#include <fmt/format.h>

#include <fstream>

namespace Sftpx
{
    namespace
    {
        // Absent and null both mean "not set".
        template <typename T>
        void readOptional(nlohmann::json const& j, char const* key, std::optional<T>& value)
        {
            const auto iter = j.find(key);
            if (iter == j.end() || iter->is_null())
                value.reset();
            else
                value = iter->get<T>();
        }

        template <typename T>
        void writeOptional(nlohmann::json& j, char const* key, std::optional<T> const& value)
        {
            if (value)
                j[key] = *value;
        }

        // Paths are stored as plain strings.
        void readOptional(nlohmann::json const& j, char const* key, std::optional<std::filesystem::path>& value)
        {
            std::optional<std::string> raw{};
            readOptional(j, key, raw);
            if (raw)
                value = *raw;
            else
                value.reset();
        }

        void writeOptional(nlohmann::json& j, char const* key, std::optional<std::filesystem::path> const& value)
        {
            if (value)
                j[key] = value->string();
        }
    }

    SessionOptions::Credential SessionOptions::credential() const
    {
        if (password)
            return Credential::Password;
        if (privateKeyPath)
            return Credential::PrivateKey;
        return Credential::None;
    }

    std::expected<void, std::string> SessionOptions::validate() const
    {
        if (host.empty())
            return std::unexpected(std::string{"host must not be empty"});
        if (user.empty())
            return std::unexpected(std::string{"user must not be empty"});
        if (port == 0)
            return std::unexpected(std::string{"port must not be 0"});
        if (connectTimeout.count() < 0)
            return std::unexpected(std::string{"connect timeout must not be negative"});
        return {};
    }

    void to_json(nlohmann::json& j, SessionOptions const& options)
    {
        j = {
            {"host", options.host},
            {"user", options.user},
            {"port", options.port},
            {"connectTimeoutSeconds", options.connectTimeout.count()},
        };

        writeOptional(j, "privateKeyPath", options.privateKeyPath);
        writeOptional(j, "knownHostsFile", options.knownHostsFile);
        writeOptional(j, "strictHostKeyCheck", options.strictHostKeyCheck);
        writeOptional(j, "logVerbosity", options.logVerbosity);
    }
    void from_json(nlohmann::json const& j, SessionOptions& options)
    {
        options = {};

        j.at("host").get_to(options.host);
        j.at("user").get_to(options.user);
        if (j.contains("port"))
            j.at("port").get_to(options.port);
        if (j.contains("connectTimeoutSeconds"))
            options.connectTimeout = std::chrono::seconds{j.at("connectTimeoutSeconds").get<long long>()};

        readOptional(j, "password", options.password);
        readOptional(j, "privateKeyPath", options.privateKeyPath);
        readOptional(j, "privateKeyPassphrase", options.privateKeyPassphrase);
        readOptional(j, "knownHostsFile", options.knownHostsFile);
        readOptional(j, "strictHostKeyCheck", options.strictHostKeyCheck);
        readOptional(j, "logVerbosity", options.logVerbosity);
    }

    std::expected<SessionOptions, std::string> loadSessionOptions(std::filesystem::path const& file)
    {
        std::ifstream reader{file, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(fmt::format("Cannot open session options file '{}'", file.string()));

        SessionOptions options{};
        try
        {
            options = nlohmann::json::parse(reader).get<SessionOptions>();
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected(fmt::format("Invalid session options in '{}': {}", file.string(), exc.what()));
        }

        if (auto valid = options.validate(); !valid)
            return std::unexpected(fmt::format("Invalid session options in '{}': {}", file.string(), valid.error()));

        return options;
    }
}
