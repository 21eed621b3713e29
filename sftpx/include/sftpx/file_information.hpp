#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace Sftpx
{
    enum class FileType : std::uint8_t
    {
        Unknown = 0,
        Regular = 1,
        Directory = 2,
        Symlink = 3,
        Special = 4,
        Socket = 5,
        CharDevice = 6,
        BlockDevice = 7,
        Fifo = 8
    };

    /**
     * @brief Derives the file type from the S_IFMT bits of a POSIX mode.
     */
    inline FileType fileTypeFromMode(std::uint32_t mode)
    {
        switch (mode & 0170000)
        {
            case 0100000:
                return FileType::Regular;
            case 0040000:
                return FileType::Directory;
            case 0120000:
                return FileType::Symlink;
            case 0140000:
                return FileType::Socket;
            case 0020000:
                return FileType::CharDevice;
            case 0060000:
                return FileType::BlockDevice;
            case 0010000:
                return FileType::Fifo;
            default:
                return FileType::Unknown;
        }
    }

    /**
     * @brief Attributes of a remote (or, during local walks, local) file system entry.
     */
    struct FileInformation
    {
        using FileType = Sftpx::FileType;

        // Name of the entry for listings, the full path for stat results.
        std::filesystem::path path{};
        FileType type{FileType::Unknown};
        std::uint64_t size{0};
        std::uint32_t uid{0};
        std::uint32_t gid{0};
        std::string owner{};
        std::string group{};
        std::filesystem::perms permissions{std::filesystem::perms::unknown};
        std::uint64_t atime{0};
        std::uint64_t mtime{0};
        std::uint64_t createTime{0};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }
        bool isUnknown() const
        {
            return type == FileType::Unknown;
        }

        // Used for directory traversal. Avoids pointer instability in vector and unique_ptr
        std::optional<std::size_t> parent{std::nullopt};
    };
}
