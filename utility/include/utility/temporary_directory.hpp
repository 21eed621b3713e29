#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief A uniquely named scratch directory below a base path, removed with all its contents on destruction.
     * Relative paths passed to the helpers are resolved against the directory.
     */
    class TemporaryDirectory
    {
      public:
        explicit TemporaryDirectory(
            std::filesystem::path basePath = std::filesystem::temp_directory_path() / "sftpx_tmpdir",
            bool removeBaseOnDestruction = false);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;
        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

        /**
         * @brief Writes content to a file, creating missing parent directories.
         *
         * @return The absolute path of the file.
         */
        std::filesystem::path writeFile(std::filesystem::path const& relative, std::string_view content) const;

        /**
         * @brief Reads a whole file. Throws std::runtime_error when it cannot be opened.
         */
        std::string readFile(std::filesystem::path const& relative) const;

        std::filesystem::path createDirectories(std::filesystem::path const& relative) const;

      private:
        std::filesystem::path basePath_;
        std::filesystem::path path_;
        bool removeBase_;
    };
}
