#pragma once

#include <sftpx/session_options.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

extern std::filesystem::path programDirectory;

namespace Sftpx::Test
{
    TEST(SessionOptionsTests, DefaultsMatchTheUsualSshSetup)
    {
        SessionOptions options{.host = "example.org", .user = "me"};
        EXPECT_EQ(options.port, 22);
        EXPECT_EQ(options.connectTimeout, std::chrono::seconds{30});
        EXPECT_FALSE(options.password.has_value());
        EXPECT_FALSE(options.privateKeyPath.has_value());
        EXPECT_TRUE(options.validate().has_value());
    }

    TEST(SessionOptionsTests, PasswordTakesPrecedenceOverKey)
    {
        SessionOptions options{.host = "h", .user = "u", .password = "secret", .privateKeyPath = "/keys/id_ed25519"};
        EXPECT_EQ(options.credential(), SessionOptions::Credential::Password);

        options.password.reset();
        EXPECT_EQ(options.credential(), SessionOptions::Credential::PrivateKey);

        options.privateKeyPath.reset();
        EXPECT_EQ(options.credential(), SessionOptions::Credential::None);
    }

    TEST(SessionOptionsTests, ValidationRejectsMissingRequiredFields)
    {
        EXPECT_FALSE((SessionOptions{.host = "", .user = "u"}.validate().has_value()));
        EXPECT_FALSE((SessionOptions{.host = "h", .user = ""}.validate().has_value()));
        EXPECT_FALSE((SessionOptions{.host = "h", .user = "u", .port = 0}.validate().has_value()));
    }

    TEST(SessionOptionsTests, ReadFromJson)
    {
        const auto json = nlohmann::json::parse(R"({
            "host": "sftp.example.org",
            "user": "deploy",
            "password": "pw",
            "port": 2222,
            "connectTimeoutSeconds": 5,
            "strictHostKeyCheck": true
        })");
        const auto options = json.get<SessionOptions>();

        EXPECT_EQ(options.host, "sftp.example.org");
        EXPECT_EQ(options.user, "deploy");
        EXPECT_EQ(options.password, "pw");
        EXPECT_EQ(options.port, 2222);
        EXPECT_EQ(options.connectTimeout, std::chrono::seconds{5});
        EXPECT_EQ(options.strictHostKeyCheck, true);
        EXPECT_FALSE(options.privateKeyPath.has_value());
    }

    TEST(SessionOptionsTests, PasswordIsNeverWritten)
    {
        SessionOptions options{.host = "h", .user = "u", .password = "secret", .privateKeyPath = "/keys/id"};
        const nlohmann::json json = options;

        EXPECT_FALSE(json.contains("password"));
        EXPECT_FALSE(json.contains("privateKeyPassphrase"));
        EXPECT_EQ(json.at("privateKeyPath").get<std::string>(), "/keys/id");
        EXPECT_EQ(json.at("port").get<int>(), 22);
        EXPECT_FALSE(json.contains("knownHostsFile"));
    }

    TEST(SessionOptionsTests, RetryFieldsAreNotPartOfTheConfiguration)
    {
        const auto json = nlohmann::json::parse(R"({"host": "h", "user": "u", "max_retries": 9, "retry_delay": 2.5})");
        const auto options = json.get<SessionOptions>();
        const nlohmann::json written = options;
        EXPECT_FALSE(written.contains("max_retries"));
        EXPECT_FALSE(written.contains("retry_delay"));
    }

    class SessionOptionsFileTests : public ::testing::Test
    {
      protected:
        std::filesystem::path write(std::string_view content)
        {
            const auto path = isolateDirectory_.path() / "options.json";
            std::ofstream{path, std::ios_base::binary} << content;
            return path;
        }

        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(SessionOptionsFileTests, ValidFileIsLoaded)
    {
        const auto result = loadSessionOptions(write(R"({"host": "h", "user": "u", "privateKeyPath": "/k"})"));
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->host, "h");
        EXPECT_EQ(result->credential(), SessionOptions::Credential::PrivateKey);
    }

    TEST_F(SessionOptionsFileTests, MissingFileIsReported)
    {
        const auto result = loadSessionOptions(isolateDirectory_.path() / "nope.json");
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("Cannot open"), std::string::npos);
    }

    TEST_F(SessionOptionsFileTests, MalformedJsonIsReported)
    {
        const auto result = loadSessionOptions(write("{ not json"));
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("Invalid session options"), std::string::npos);
    }

    TEST_F(SessionOptionsFileTests, MissingHostIsReported)
    {
        const auto result = loadSessionOptions(write(R"({"user": "u"})"));
        ASSERT_FALSE(result.has_value());
    }

    TEST_F(SessionOptionsFileTests, EmptyHostFailsValidation)
    {
        const auto result = loadSessionOptions(write(R"({"host": "", "user": "u"})"));
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("host must not be empty"), std::string::npos);
    }
}
