#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "core/Filter.hpp"
#include "core/models/File.hpp"
#include "TestHelpers.hpp"


// PatternFilter测试用例
class PatternFilterTest : public ::testing::Test {
protected:
    PatternFilter filter;
    fs::path testDir = testDirectory("backupkeeper_filter_test");
    fs::path textFile = testDir / "notes" / "a.txt";
    fs::path tempFile = testDir / "notes" / "b.tmp";

    void SetUp() override {
        fs::create_directories(testDir / "notes");
        std::ofstream(textFile) << "text";
        std::ofstream(tempFile) << "temporary";
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(PatternFilterTest, TestAddAndRemovePatterns) {
    filter.addIncludePattern("*.txt");
    filter.addExcludePattern("*.tmp");
    EXPECT_EQ(1u, filter.getIncludePatterns().size());
    EXPECT_EQ(1u, filter.getExcludePatterns().size());

    EXPECT_TRUE(filter.removeIncludePattern("*.txt"));
    EXPECT_FALSE(filter.removeIncludePattern("*.txt"));
    EXPECT_TRUE(filter.getIncludePatterns().empty());

    filter.clearExcludePatterns();
    EXPECT_TRUE(filter.getExcludePatterns().empty());
}

TEST_F(PatternFilterTest, TestPatternsAreTrimmedAndBlankIgnored) {
    filter.addIncludePattern("  *.txt \n");
    filter.addIncludePattern("   ");
    filter.addExcludePattern("");
    ASSERT_EQ(1u, filter.getIncludePatterns().size());
    EXPECT_EQ("*.txt", filter.getIncludePatterns()[0]);
    EXPECT_TRUE(filter.getExcludePatterns().empty());
}

TEST_F(PatternFilterTest, TestMatchAllWhenNoPatterns) {
    EXPECT_TRUE(filter.match(File(textFile)));
    EXPECT_TRUE(filter.match(File(tempFile)));
}

TEST_F(PatternFilterTest, TestIncludePattern) {
    filter.addIncludePattern("*.txt");
    EXPECT_TRUE(filter.match(File(textFile)));
    EXPECT_FALSE(filter.match(File(tempFile)));
}

TEST_F(PatternFilterTest, TestExcludePattern) {
    filter.addExcludePattern("*.tmp");
    EXPECT_TRUE(filter.match(File(textFile)));
    EXPECT_FALSE(filter.match(File(tempFile)));
}

// 同时命中包含和排除模式时排除
TEST_F(PatternFilterTest, TestExcludeTakesPrecedence) {
    filter.addIncludePattern("a.*");
    filter.addExcludePattern("*.txt");
    EXPECT_FALSE(filter.match(File(textFile)));
    EXPECT_FALSE(filter.matchPath("/data/a.txt"));
}

TEST_F(PatternFilterTest, TestFullPathPattern) {
    filter.addExcludePattern("*/notes/*");
    EXPECT_FALSE(filter.matchPath(textFile.string()));
    EXPECT_TRUE(filter.matchPath((testDir / "other" / "a.txt").string()));
}

TEST_F(PatternFilterTest, TestCharacterClassesAndQuestionMark) {
    filter.addIncludePattern("report_?.csv");
    filter.addIncludePattern("[ab].log");
    EXPECT_TRUE(filter.matchPath("/x/report_1.csv"));
    EXPECT_FALSE(filter.matchPath("/x/report_12.csv"));
    EXPECT_TRUE(filter.matchPath("/x/b.log"));
    EXPECT_FALSE(filter.matchPath("/x/c.log"));
}

TEST_F(PatternFilterTest, TestMatchIsCaseSensitive) {
    filter.addIncludePattern("*.txt");
    EXPECT_FALSE(filter.matchPath("/x/README.TXT"));
}

TEST_F(PatternFilterTest, TestFilterDescription) {
    EXPECT_NE(filter.getFilterDescription().find("all files match"), std::string::npos);
    filter.addIncludePattern("*.txt");
    filter.addExcludePattern("*.tmp");
    std::string desc = filter.getFilterDescription();
    EXPECT_NE(desc.find("include (1): [*.txt]"), std::string::npos);
    EXPECT_NE(desc.find("exclude (1): [*.tmp]"), std::string::npos);
}

TEST(PatternFilterConstructionTest, TestConstructFromLists) {
    PatternFilter filter({"*.txt", " "}, {"secret*"});
    EXPECT_EQ(1u, filter.getIncludePatterns().size());
    EXPECT_TRUE(filter.matchPath("/docs/a.txt"));
    EXPECT_FALSE(filter.matchPath("/docs/secret.txt"));
    EXPECT_FALSE(filter.matchPath("/docs/b.tmp"));
}
