#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include "core/JobFile.hpp"
#include "TestHelpers.hpp"

TEST(JobFileTest, ParsesFullDescription) {
    Job job;
    std::string error;
    ASSERT_TRUE(JobFile::parse(R"({
        "name": "documents",
        "sources": ["/home/me/docs", "/home/me/todo.txt"],
        "include_patterns": ["*.txt", "*.md"],
        "exclude_patterns": ["*.tmp"],
        "destination_type": "local",
        "destination": {"local_path": "/backup"},
        "conflict_policy": "overwrite",
        "schedule": "0 3 * * *"
    })", job, error)) << error;

    EXPECT_EQ("documents", job.name);
    ASSERT_EQ(2u, job.sources.size());
    EXPECT_EQ("/home/me/todo.txt", job.sources[1]);
    EXPECT_EQ(2u, job.includePatterns.size());
    EXPECT_EQ(1u, job.excludePatterns.size());
    EXPECT_EQ("local", job.destinationType);
    EXPECT_NE(job.destinationConfig.find("\"local_path\":\"/backup\""), std::string::npos);
    EXPECT_EQ(ConflictPolicy::OVERWRITE, job.conflictPolicy);
    EXPECT_EQ("0 3 * * *", job.schedule);
}

TEST(JobFileTest, AppliesDefaults) {
    Job job;
    std::string error;
    ASSERT_TRUE(JobFile::parse(R"({"name": "minimal", "sources": ["/data"]})", job, error));
    EXPECT_EQ("local", job.destinationType);
    EXPECT_EQ(ConflictPolicy::RENAME, job.conflictPolicy);
    EXPECT_TRUE(job.includePatterns.empty());
    EXPECT_TRUE(job.active);
}

TEST(JobFileTest, RejectsInvalidDescriptions) {
    Job job;
    std::string error;
    EXPECT_FALSE(JobFile::parse("{", job, error));
    EXPECT_FALSE(JobFile::parse(R"({"sources": ["/data"]})", job, error));
    EXPECT_EQ("Job name is required", error);
    EXPECT_FALSE(JobFile::parse(R"({"name": "a/b", "sources": ["/data"]})", job, error));
    EXPECT_FALSE(JobFile::parse(R"({"name": "..", "sources": ["/data"]})", job, error));
    EXPECT_FALSE(JobFile::parse(R"({"name": "x", "sources": []})", job, error));
    EXPECT_FALSE(JobFile::parse(R"({"name": "x", "sources": [1]})", job, error));
    EXPECT_FALSE(JobFile::parse(R"({"name": "x", "sources": ["/d"], "conflict_policy": "merge"})", job, error));
    EXPECT_NE(error.find("merge"), std::string::npos);
    EXPECT_FALSE(JobFile::parse(R"({"name": "x", "sources": ["/d"], "destination": "/b"})", job, error));
}

TEST(JobFileTest, SerializedJobParsesBack) {
    Job job;
    job.name = "photos";
    job.sources = {"/pics"};
    job.excludePatterns = {"*.raw"};
    job.destinationConfig = "{\"local_path\": \"/mnt/backup\"}";
    job.conflictPolicy = ConflictPolicy::SKIP;

    Job parsed;
    std::string error;
    ASSERT_TRUE(JobFile::parse(JobFile::toJson(job), parsed, error)) << error;
    EXPECT_EQ(job.name, parsed.name);
    EXPECT_EQ(job.sources, parsed.sources);
    EXPECT_EQ(job.excludePatterns, parsed.excludePatterns);
    EXPECT_EQ(ConflictPolicy::SKIP, parsed.conflictPolicy);
    EXPECT_NE(parsed.destinationConfig.find("/mnt/backup"), std::string::npos);
}

TEST(JobFileTest, LoadReportsMissingFile) {
    Job job;
    std::string error;
    fs::path file = fs::temp_directory_path() / "backupkeeper_jobfile_test.json";
    fs::remove(file);
    EXPECT_FALSE(JobFile::load(file.string(), job, error));
    EXPECT_NE(error.find("Failed to open job file"), std::string::npos);

    writeFile(file, R"({"name": "loaded", "sources": ["/data"]})");
    EXPECT_TRUE(JobFile::load(file.string(), job, error));
    EXPECT_EQ("loaded", job.name);
    fs::remove(file);
}
