#pragma once

#include <sftpx/transport_engine.hpp>

#include <gmock/gmock.h>

namespace Sftpx::Test
{
    class TransportEngineMock : public Sftpx::TransportEngine
    {
      public:
        MOCK_METHOD((std::expected<void, SftpError>), connect, (SessionOptions const&), (override));
        MOCK_METHOD(void, closeFileOperations, (), (override));
        MOCK_METHOD(void, disconnect, (), (override));
        MOCK_METHOD(bool, isConnected, (), (const, override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            upload,
            (std::filesystem::path const&, std::string const&, ProgressCallback const&),
            (override));
        MOCK_METHOD(
            (std::expected<void, SftpError>),
            download,
            (std::string const&, std::filesystem::path const&, ProgressCallback const&),
            (override));
        MOCK_METHOD(
            (std::expected<std::vector<FileInformation>, SftpError>),
            listDirectory,
            (std::string const&),
            (override));
        MOCK_METHOD((std::expected<FileInformation, SftpError>), stat, (std::string const&), (override));
        MOCK_METHOD((std::expected<void, SftpError>), createDirectory, (std::string const&, std::uint32_t), (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeDirectory, (std::string const&), (override));
        MOCK_METHOD((std::expected<void, SftpError>), removeFile, (std::string const&), (override));
    };
}
