#include <sftpx/local_enumerator.hpp>
#include <sftpx/file_information.hpp>

#include <utility/directory_traversal.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace Sftpx
{
    namespace
    {
        FileType fileTypeOf(std::filesystem::file_status const& status)
        {
            switch (status.type())
            {
                case std::filesystem::file_type::regular:
                    return FileType::Regular;
                case std::filesystem::file_type::directory:
                    return FileType::Directory;
                case std::filesystem::file_type::symlink:
                    return FileType::Symlink;
                case std::filesystem::file_type::block:
                    return FileType::BlockDevice;
                case std::filesystem::file_type::character:
                    return FileType::CharDevice;
                case std::filesystem::file_type::fifo:
                    return FileType::Fifo;
                case std::filesystem::file_type::socket:
                    return FileType::Socket;
                default:
                    return FileType::Unknown;
            }
        }

        Error notFound(std::filesystem::path const& path, std::error_code const& ec)
        {
            return makeLocalError(
                ErrorKind::NotFound,
                std::errc::no_such_file_or_directory,
                fmt::format("Cannot read local path '{}': {}", path.string(), ec.message()));
        }

        std::expected<std::vector<FileInformation>, Error> scanLocalDirectory(std::filesystem::path const& directory)
        {
            std::vector<FileInformation> entries{};
            std::error_code ec{};
            std::filesystem::directory_iterator iter{directory, ec};
            if (ec)
                return std::unexpected(notFound(directory, ec));

            for (auto const end = std::filesystem::directory_iterator{}; iter != end; iter.increment(ec))
            {
                if (ec)
                    return std::unexpected(notFound(directory, ec));

                auto const& dirEntry = *iter;
                const auto status = dirEntry.symlink_status(ec);
                if (ec)
                    return std::unexpected(notFound(dirEntry.path(), ec));

                FileInformation entry{};
                entry.path = dirEntry.path().filename();
                entry.type = fileTypeOf(status);
                entry.permissions = status.permissions();
                if (entry.isRegularFile())
                {
                    entry.size = dirEntry.file_size(ec);
                    if (ec)
                        return std::unexpected(notFound(dirEntry.path(), ec));
                }
                entries.push_back(std::move(entry));
            }
            if (ec)
                return std::unexpected(notFound(directory, ec));

            std::sort(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
                return lhs.path < rhs.path;
            });
            return entries;
        }
    }

    std::expected<std::vector<std::filesystem::path>, Error> enumerateLocalFiles(std::filesystem::path const& root)
    {
        std::error_code ec{};
        const auto rootStatus = std::filesystem::status(root, ec);
        if (ec || !std::filesystem::exists(rootStatus))
        {
            return std::unexpected(makeLocalError(
                ErrorKind::NotFound,
                std::errc::no_such_file_or_directory,
                fmt::format("Local path not found: {}", root.string())));
        }

        if (std::filesystem::is_regular_file(rootStatus))
            return std::vector<std::filesystem::path>{root};

        using Scanner = decltype(&scanLocalDirectory);
        Utility::DeepDirectoryWalker<FileInformation, Error, Scanner> walker{root, &scanLocalDirectory};
        if (auto result = walker.run(); !result)
            return std::unexpected(std::move(result).error());

        std::vector<std::filesystem::path> files{};
        for (auto const& entry : walker.entries())
        {
            if (entry.isRegularFile())
                files.push_back(walker.fullPath(entry));
        }
        Log::debug("Found {} files ({} bytes) below '{}'", files.size(), walker.discoveredBytes(), root.string());
        return files;
    }
}
