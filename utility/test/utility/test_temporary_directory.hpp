#pragma once

#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

extern std::filesystem::path programDirectory;

namespace Utility::Test
{
    class TemporaryDirectoryTests : public ::testing::Test
    {
      protected:
        std::filesystem::path base_{programDirectory / "temp_base"};
    };

    TEST_F(TemporaryDirectoryTests, DirectoryExistsBelowBase)
    {
        TemporaryDirectory directory{base_};
        EXPECT_TRUE(std::filesystem::is_directory(directory.path()));
        EXPECT_EQ(directory.path().parent_path(), base_);
    }

    TEST_F(TemporaryDirectoryTests, TwoDirectoriesAreDistinct)
    {
        TemporaryDirectory first{base_};
        TemporaryDirectory second{base_};
        EXPECT_NE(first.path(), second.path());
    }

    TEST_F(TemporaryDirectoryTests, ContentsAreRemovedOnDestruction)
    {
        std::filesystem::path path{};
        {
            TemporaryDirectory directory{base_};
            path = directory.path();
            directory.writeFile("nested/file.txt", "content");
        }
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_TRUE(std::filesystem::exists(base_));
    }

    TEST_F(TemporaryDirectoryTests, BaseIsRemovedWhenRequested)
    {
        const auto base = base_ / "removable";
        {
            TemporaryDirectory directory{base, true};
        }
        EXPECT_FALSE(std::filesystem::exists(base));
    }

    TEST_F(TemporaryDirectoryTests, WrittenFilesCanBeReadBack)
    {
        TemporaryDirectory directory{base_};
        const auto written = directory.writeFile("a/b/data.bin", std::string_view{"x\0y", 3});

        EXPECT_EQ(written, directory.path() / "a" / "b" / "data.bin");
        EXPECT_EQ(directory.readFile("a/b/data.bin"), std::string("x\0y", 3));
    }

    TEST_F(TemporaryDirectoryTests, ReadingAMissingFileThrows)
    {
        TemporaryDirectory directory{base_};
        EXPECT_THROW(static_cast<void>(directory.readFile("missing.txt")), std::runtime_error);
    }

    TEST_F(TemporaryDirectoryTests, CreateDirectoriesCreatesTheWholeChain)
    {
        TemporaryDirectory directory{base_};
        const auto created = directory.createDirectories("one/two/three");
        EXPECT_TRUE(std::filesystem::is_directory(created));
        EXPECT_EQ(created, directory.path() / "one" / "two" / "three");
    }
}
