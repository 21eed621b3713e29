#include <sftpx/remote_path.hpp>

#include <algorithm>

namespace Sftpx
{
    namespace
    {
        constexpr char remoteSeparator = '/';

        bool isSeparator(char c)
        {
            return c == '\\' || c == static_cast<char>(std::filesystem::path::preferred_separator);
        }
    }

    std::string normalizeRemotePath(std::string_view path)
    {
        std::string result{path};
        std::replace_if(result.begin(), result.end(), isSeparator, remoteSeparator);
        return result;
    }

    std::string normalizeRemotePath(std::filesystem::path const& path)
    {
        return normalizeRemotePath(std::string_view{path.string()});
    }

    std::string joinRemotePath(std::string_view base, std::string_view relative)
    {
        while (!relative.empty() && relative.front() == remoteSeparator)
            relative.remove_prefix(1);

        if (base.empty() || base == ".")
            return std::string{relative};
        if (relative.empty())
            return std::string{base};

        std::string result{base};
        if (result.back() != remoteSeparator)
            result.push_back(remoteSeparator);
        result.append(relative);
        return result;
    }

    std::string remoteParentPath(std::string_view path)
    {
        while (path.size() > 1 && path.back() == remoteSeparator)
            path.remove_suffix(1);

        const auto pos = path.rfind(remoteSeparator);
        if (pos == std::string_view::npos)
            return {};
        if (pos == 0)
            return std::string(1, remoteSeparator);
        return std::string{path.substr(0, pos)};
    }

    std::vector<std::string> remotePathSegments(std::string_view path)
    {
        std::vector<std::string> segments{};
        std::string current{};
        if (!path.empty() && path.front() == remoteSeparator)
            current.push_back(remoteSeparator);

        std::size_t start = 0;
        while (start < path.size())
        {
            auto end = path.find(remoteSeparator, start);
            if (end == std::string_view::npos)
                end = path.size();

            const auto segment = path.substr(start, end - start);
            if (!segment.empty() && segment != ".")
            {
                if (!current.empty() && current.back() != remoteSeparator)
                    current.push_back(remoteSeparator);
                current.append(segment);
                segments.push_back(current);
            }
            start = end + 1;
        }
        return segments;
    }
}
