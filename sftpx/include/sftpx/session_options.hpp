#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace Sftpx
{
    /**
     * @brief Everything needed to open a session. Held immutably by the session once constructed.
     *
     * If both a password and a private key are given, only the password is used.
     */
    struct SessionOptions
    {
        static constexpr std::uint16_t defaultPort = 22;
        static constexpr std::chrono::seconds defaultConnectTimeout{30};

        std::string host{};
        std::string user{};
        std::optional<std::string> password{std::nullopt};
        std::optional<std::filesystem::path> privateKeyPath{std::nullopt};
        std::optional<std::string> privateKeyPassphrase{std::nullopt};
        std::uint16_t port{defaultPort};
        std::chrono::seconds connectTimeout{defaultConnectTimeout};

        // Unknown hosts are accepted unless strictHostKeyCheck is set. Changed host keys are always rejected.
        std::optional<std::filesystem::path> knownHostsFile{std::nullopt};
        std::optional<bool> strictHostKeyCheck{std::nullopt};
        // libssh verbosity, e.g. "0" to "4".
        std::optional<std::string> logVerbosity{std::nullopt};

        enum class Credential
        {
            Password,
            PrivateKey,
            // Let the engine try the agent and the default keys.
            None,
        };

        Credential credential() const;

        /**
         * @brief Checks that the required fields are set.
         *
         * @return std::expected<void, std::string> A description of the first problem found.
         */
        std::expected<void, std::string> validate() const;
    };

    // The password is read but never written, secrets do not belong in saved configuration.
    void to_json(nlohmann::json& j, SessionOptions const& options);
    void from_json(nlohmann::json const& j, SessionOptions& options);

    /**
     * @brief Reads and validates session options from a json file.
     */
    std::expected<SessionOptions, std::string> loadSessionOptions(std::filesystem::path const& file);
}
