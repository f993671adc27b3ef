#include <gtest/gtest.h>
#include <filesystem>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <cstdlib>
#include "core/models/File.hpp"
#include "TestHelpers.hpp"

using namespace std::chrono;

// File类测试用例
class FileTest : public ::testing::Test {
protected:
    fs::path testDir = testDirectory("backupkeeper_file_test");
    fs::path testFile = testDir / "test.txt";
    fs::path testDirPath = testDir / "subdir";
    fs::path testSymlink = testDir / "symlink.txt";
    bool hasSymlink = false;

    void SetUp() override {
        fs::create_directories(testDir);
        fs::create_directories(testDirPath);

        std::ofstream(testFile) << "This is a test file.";

        std::error_code ec;
        fs::create_symlink(testFile, testSymlink, ec);
        hasSymlink = !ec;
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// 测试默认构造函数
TEST_F(FileTest, DefaultConstructor) {
    File file;
    EXPECT_FALSE(file.exists());
    EXPECT_FALSE(file.isRegularFile());
    EXPECT_FALSE(file.isDirectory());
    EXPECT_FALSE(file.isSizeKnown());
}

TEST_F(FileTest, PathConstructor) {
    File file(testFile);
    EXPECT_TRUE(file.exists());
    EXPECT_TRUE(file.isRegularFile());
    EXPECT_EQ(file.getFilePath(), testFile);
    EXPECT_EQ(file.getFileName(), "test.txt");
}

TEST_F(FileTest, InitializeMethod) {
    File file;
    file.initialize(testFile);
    EXPECT_TRUE(file.exists());
    EXPECT_EQ(file.getFileName(), "test.txt");

    // 重新初始化为目录后大小信息被清除
    file.initialize(testDirPath);
    EXPECT_TRUE(file.isDirectory());
    EXPECT_FALSE(file.isSizeKnown());
    EXPECT_EQ(file.getFileSize(), 0u);
}

TEST_F(FileTest, SizeOfRegularFile) {
    File file(testFile);
    EXPECT_TRUE(file.isSizeKnown());
    EXPECT_EQ(file.getFileSize(), std::string("This is a test file.").size());
    EXPECT_EQ(file.getFileType(), fs::file_type::regular);
}

TEST_F(FileTest, FileTypeChecks) {
    File regularFile(testFile);
    EXPECT_TRUE(regularFile.isRegularFile());
    EXPECT_FALSE(regularFile.isDirectory());
    EXPECT_FALSE(regularFile.isSymbolicLink());

    File dirFile(testDirPath);
    EXPECT_TRUE(dirFile.isDirectory());
    EXPECT_FALSE(dirFile.isRegularFile());

    if (hasSymlink) {
        File symlinkFile(testSymlink);
        EXPECT_TRUE(symlinkFile.isSymbolicLink());
        EXPECT_FALSE(symlinkFile.isRegularFile());
        EXPECT_TRUE(symlinkFile.exists());
    }
}

TEST_F(FileTest, ModificationTime) {
    File file(testFile);
    auto now = system_clock::now();
    EXPECT_LE(file.getLastModifiedTime(), now + seconds(1));
    EXPECT_GT(file.getLastModifiedTime(), now - minutes(5));

    auto oldModifiedTime = file.getLastModifiedTime();
    std::this_thread::sleep_for(milliseconds(100));
    {
        std::ofstream fileStream(testFile, std::ios::out | std::ios::trunc);
        fileStream << "Updated content";
    }

    File updatedFile(testFile);
    EXPECT_GT(updatedFile.getLastModifiedTime(), oldModifiedTime);
}

TEST_F(FileTest, ToSystemTimeMatchesFileClock) {
    auto fileTime = fs::last_write_time(testFile);
    auto converted = toSystemTime(fileTime);
    // 两个时钟的换算误差应当很小
    auto drift = duration_cast<milliseconds>(converted - File(testFile).getLastModifiedTime()).count();
    EXPECT_LE(std::abs(drift), 50);
}

TEST_F(FileTest, StringRepresentation) {
    File file(testFile);
    std::string str = file.toString();
    EXPECT_NE(str.find("test.txt"), std::string::npos);
    EXPECT_NE(str.find("Regular File"), std::string::npos);
}

TEST_F(FileTest, ComparisonOperations) {
    File file1(testFile);
    File file2(testFile);
    File file3(testDirPath);

    EXPECT_EQ(file1, file2);
    EXPECT_FALSE(file1 != file2);
    EXPECT_NE(file1, file3);
    EXPECT_FALSE(file1 == file3);
}

TEST_F(FileTest, NonExistentFile) {
    File file(testDir / "non_existent.txt");

    EXPECT_FALSE(file.exists());
    EXPECT_FALSE(file.isRegularFile());
    EXPECT_FALSE(file.isDirectory());
    EXPECT_FALSE(file.isSizeKnown());
    EXPECT_EQ(file.getFileSize(), 0u);
}
