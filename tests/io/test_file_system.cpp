#include "patchmark/io/file_system.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace patchmark {

class FileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_path_ = std::filesystem::temp_directory_path()
                     / ("patchmark_fs_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".diff");
        std::ofstream out(temp_path_, std::ios::binary);
        out << "@@ -1 +1 @@\r\n-a\n+b\n";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
    }

    std::filesystem::path temp_path_;
    FileSystem filesystem_;
};

TEST_F(FileSystemTest, ReadsWholeFileVerbatim)
{
    auto text = filesystem_.read_text(temp_path_.string());

    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "@@ -1 +1 @@\r\n-a\n+b\n");
}

TEST_F(FileSystemTest, MissingFileIsNullopt)
{
    auto missing = (temp_path_.parent_path() / "patchmark_no_such_file.diff").string();

    EXPECT_FALSE(filesystem_.file_exists(missing));
    EXPECT_FALSE(filesystem_.read_text(missing).has_value());
}

TEST_F(FileSystemTest, ExistingFileExists)
{
    EXPECT_TRUE(filesystem_.file_exists(temp_path_.string()));
}

} // namespace patchmark
