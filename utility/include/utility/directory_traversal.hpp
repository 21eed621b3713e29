#pragma once

#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace Utility
{
    /**
     * @brief Breadth first walk over a directory tree, one directory per step.
     *
     * The walker does not touch any file system itself, the scanner lists the direct children of a directory.
     * This way the same walk works for local directories and for remote ones behind a connection.
     * All entries end up in one flat vector, entry 0 is the root and every other entry refers to its parent by
     * index. Children that report isDirectory() are queued for scanning, all others are only recorded.
     *
     * @tparam EntryT Needs path, type, size and parent members and isDirectory(), isRegularFile().
     * @tparam ErrorT What the scanner reports on failure.
     * @tparam ScannerT Callable: std::filesystem::path const& -> std::expected<std::vector<EntryT>, ErrorT>.
     */
    template <typename EntryT, typename ErrorT, typename ScannerT>
    requires std::is_invocable_r_v<std::expected<std::vector<EntryT>, ErrorT>, ScannerT&, std::filesystem::path const&>
    class DeepDirectoryWalker
    {
      public:
        DeepDirectoryWalker(std::filesystem::path rootPath, ScannerT scanner)
            : scanner_{std::move(scanner)}
        {
            EntryT root{};
            root.path = std::move(rootPath);
            root.type = EntryT::FileType::Directory;
            entries_.push_back(std::move(root));
        }

        bool done() const
        {
            return pending_.empty();
        }

        /**
         * @brief Scans the next queued directory.
         *
         * @return The children found in it, valid until the next call. Empty when the walk is done.
         * When the scanner fails, the directory stays queued and pending() returns it.
         */
        std::expected<std::span<EntryT const>, ErrorT> step()
        {
            if (done())
                return std::span<EntryT const>{};

            const auto directory = pending_.front();
            auto children = scanner_(fullPath(entries_[directory]));
            if (!children)
                return std::unexpected(std::move(children).error());
            pending_.pop_front();

            const auto first = entries_.size();
            for (auto& child : *children)
            {
                child.parent = directory;
                if (child.isDirectory())
                    pending_.push_back(entries_.size());
                else if (child.isRegularFile())
                    discoveredBytes_ += child.size;
                entries_.push_back(std::move(child));
            }
            return std::span<EntryT const>{entries_}.subspan(first);
        }

        std::expected<void, ErrorT> run()
        {
            while (!done())
            {
                if (auto stepped = step(); !stepped)
                    return std::unexpected(std::move(stepped).error());
            }
            return {};
        }

        /**
         * @brief The directory the next step scans, or nullptr when done.
         */
        EntryT const* pending() const
        {
            if (done())
                return nullptr;
            return &entries_[pending_.front()];
        }

        std::vector<EntryT> const& entries() const
        {
            return entries_;
        }

        /**
         * @brief Sum of the sizes of all regular files found so far.
         */
        std::uint64_t discoveredBytes() const
        {
            return discoveredBytes_;
        }

        std::filesystem::path fullPath(EntryT const& entry) const
        {
            if (!entry.parent)
                return entry.path;
            return fullPath(parentOf(entry)) / entry.path;
        }

        /**
         * @brief Path below the root. Empty for the root itself.
         */
        std::filesystem::path relativePath(EntryT const& entry) const
        {
            if (!entry.parent)
                return {};
            if (*entry.parent == 0)
                return entry.path;
            return relativePath(parentOf(entry)) / entry.path;
        }

      private:
        EntryT const& parentOf(EntryT const& entry) const
        {
            if (*entry.parent >= entries_.size())
                throw std::out_of_range("Parent index is out of range");
            return entries_[*entry.parent];
        }

      private:
        ScannerT scanner_;
        std::vector<EntryT> entries_{};
        // Starts with the root.
        std::deque<std::size_t> pending_{0};
        std::uint64_t discoveredBytes_{0};
    };
}
