#pragma once

#include <sftpx/error.hpp>

#include <expected>
#include <filesystem>
#include <vector>

namespace Sftpx
{
    /**
     * @brief Lists every regular file below root, at any depth.
     *
     * The walk is breadth first and the entries of each directory are sorted by name, so the result is stable for an
     * unchanged tree. Directories, symlinks (never followed) and special files are not part of the result. A root that
     * is a regular file itself yields just that file.
     *
     * @param root The local directory to walk.
     * @return std::expected<std::vector<std::filesystem::path>, Error> The files, or a NotFound error if root does not
     * exist or any part of the tree cannot be read.
     */
    std::expected<std::vector<std::filesystem::path>, Error> enumerateLocalFiles(std::filesystem::path const& root);
}
