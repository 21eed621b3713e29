#include <utility/temporary_directory.hpp>

#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

namespace Utility
{
    namespace
    {
        constexpr int creationAttempts = 100;

        std::string randomName(std::mt19937_64& rng)
        {
            static constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
            std::uniform_int_distribution<std::size_t> pick{0, alphabet.size() - 1};

            std::string name{"dir"};
            for (int i = 0; i != 12; ++i)
                name.push_back(alphabet[pick(rng)]);
            return name;
        }
    }

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnDestruction)
        : basePath_{std::move(basePath)}
        , path_{}
        , removeBase_{removeBaseOnDestruction}
    {
        std::filesystem::create_directories(basePath_);

        std::mt19937_64 rng{std::random_device{}()};
        for (int attempt = 0; attempt != creationAttempts; ++attempt)
        {
            auto candidate = basePath_ / randomName(rng);
            // create_directory returns false when the name is taken.
            if (std::filesystem::create_directory(candidate))
            {
                path_ = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("Could not create a temporary directory below: " + basePath_.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
        if (removeBase_)
            std::filesystem::remove(basePath_, ignored);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }

    std::filesystem::path
    TemporaryDirectory::writeFile(std::filesystem::path const& relative, std::string_view content) const
    {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());

        std::ofstream writer{target, std::ios_base::binary | std::ios_base::trunc};
        if (!writer)
            throw std::runtime_error("Could not open for writing: " + target.string());
        writer.write(content.data(), static_cast<std::streamsize>(content.size()));
        return target;
    }

    std::string TemporaryDirectory::readFile(std::filesystem::path const& relative) const
    {
        const auto source = path_ / relative;
        std::ifstream reader{source, std::ios_base::binary};
        if (!reader)
            throw std::runtime_error("Could not open for reading: " + source.string());
        return std::string{std::istreambuf_iterator<char>{reader}, std::istreambuf_iterator<char>{}};
    }

    std::filesystem::path TemporaryDirectory::createDirectories(std::filesystem::path const& relative) const
    {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target);
        return target;
    }
}
