#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Sftpx
{
    /**
     * @brief Converts a path into the forward slash form the remote server expects.
     *
     * Every backslash and every host native separator becomes '/'. Nothing else is touched: "." and ".." are kept,
     * the file system is not consulted and the path does not need to exist. Normalizing twice yields the same result.
     *
     * @param path The path to normalize.
     * @return std::string The canonical remote path.
     */
    std::string normalizeRemotePath(std::string_view path);
    std::string normalizeRemotePath(std::filesystem::path const& path);
    inline std::string normalizeRemotePath(std::string const& path)
    {
        return normalizeRemotePath(std::string_view{path});
    }
    inline std::string normalizeRemotePath(char const* path)
    {
        return normalizeRemotePath(std::string_view{path});
    }

    /**
     * @brief Joins a relative path onto a remote base directory without doubling slashes.
     * An empty or "." base yields the relative part alone.
     */
    std::string joinRemotePath(std::string_view base, std::string_view relative);

    /**
     * @brief Returns the parent directory of a normalized remote path.
     * "a/b/c" -> "a/b", "/a" -> "/", "a" -> "".
     */
    std::string remoteParentPath(std::string_view path);

    /**
     * @brief Returns all cumulative prefixes of a normalized remote path, shortest first.
     * "/a/b" -> {"/a", "/a/b"}, "a/b" -> {"a", "a/b"}. "." segments are skipped.
     */
    std::vector<std::string> remotePathSegments(std::string_view path);
}
