#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "utils/FileSystem.hpp"
#include "TestHelpers.hpp"

class FileSystemTest : public ::testing::Test {
protected:
    fs::path testDir = testDirectory("backupkeeper_filesystem_test");

    void SetUp() override {
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(FileSystemTest, CopyFileCreatesParentsAndKeepsModificationTime) {
    fs::path source = testDir / "source.txt";
    fs::path target = testDir / "nested" / "dir" / "target.txt";
    writeFile(source, "payload");
    auto past = fs::last_write_time(source) - std::chrono::hours(2);
    fs::last_write_time(source, past);

    std::string error;
    ASSERT_TRUE(FileSystem::copyFile(source.string(), target.string(), &error)) << error;
    EXPECT_EQ("payload", readFile(target));
    EXPECT_EQ(fs::last_write_time(source), fs::last_write_time(target));
}

TEST_F(FileSystemTest, CopyFileOverwritesExistingTarget) {
    writeFile(testDir / "source.txt", "new");
    writeFile(testDir / "target.txt", "old content");
    ASSERT_TRUE(FileSystem::copyFile((testDir / "source.txt").string(), (testDir / "target.txt").string()));
    EXPECT_EQ("new", readFile(testDir / "target.txt"));
}

TEST_F(FileSystemTest, CopyFileRejectsDirectorySource) {
    fs::create_directories(testDir / "dir");
    std::string error;
    EXPECT_FALSE(FileSystem::copyFile((testDir / "dir").string(), (testDir / "out").string(), &error));
    EXPECT_NE(error.find("not a regular file"), std::string::npos);
}

TEST_F(FileSystemTest, RenameReplacesTarget) {
    writeFile(testDir / "from.txt", "from");
    writeFile(testDir / "to.txt", "to");
    ASSERT_TRUE(FileSystem::renameFile((testDir / "from.txt").string(), (testDir / "to.txt").string()));
    EXPECT_FALSE(FileSystem::exists((testDir / "from.txt").string()));
    EXPECT_EQ("from", readFile(testDir / "to.txt"));
}

TEST_F(FileSystemTest, SizeAndRemove) {
    writeFile(testDir / "sized.bin", std::string(1234, 'x'));
    uint64_t size = 0;
    ASSERT_TRUE(FileSystem::getFileSize((testDir / "sized.bin").string(), size));
    EXPECT_EQ(1234u, size);

    std::string error;
    EXPECT_FALSE(FileSystem::getFileSize((testDir / "missing.bin").string(), size, &error));
    EXPECT_FALSE(error.empty());

    EXPECT_TRUE(FileSystem::removeFile((testDir / "sized.bin").string()));
    EXPECT_TRUE(FileSystem::removeFile((testDir / "sized.bin").string()));
    EXPECT_FALSE(FileSystem::exists((testDir / "sized.bin").string()));
}
