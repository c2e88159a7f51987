// ==============================================================================
// test_rename_gtest.cpp - Тесты переименования отчётов (GoogleTest)
// ==============================================================================

#include "curator/output.hpp"
#include "curator/rename.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace curator::curate::test {

namespace {

const std::string SHA256_A = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

std::string report_with_sha256(const std::string& sha256) {
    return R"({"target": {"file": {"sha256": ")" + sha256 + R"("}}})";
}

}  // namespace

class RenameTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("curator_rename_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream file(test_dir_ / name, std::ios::binary);
        file << content;
    }

    static output::OutputConfig quiet() {
        output::OutputConfig cfg;
        cfg.quiet = true;
        return cfg;
    }
};

TEST_F(RenameTest, RenamesToSha256) {
    write_file("1.json", report_with_sha256(SHA256_A));
    output::Writer writer(quiet());

    RenameCounts counts = rename_reports(test_dir_, writer);

    EXPECT_EQ(counts.renamed, 1u);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "1.json"));
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / (SHA256_A + ".json")));
}

TEST_F(RenameTest, ExistingTarget_Skipped) {
    write_file("1.json", report_with_sha256(SHA256_A));
    write_file(SHA256_A + ".json", report_with_sha256(SHA256_A));
    output::Writer writer(quiet());

    RenameCounts counts = rename_reports(test_dir_, writer);

    EXPECT_EQ(counts.renamed, 0u);
    EXPECT_EQ(counts.skipped, 2u);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "1.json"));
}

TEST_F(RenameTest, MissingHashAndBrokenJson_Counted) {
    write_file("nohash.json", R"({"target": {"file": {}}})");
    write_file("broken.json", "{");
    output::Writer writer(quiet());

    ::testing::internal::CaptureStderr();
    RenameCounts counts = rename_reports(test_dir_, writer);
    std::string captured = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(counts.missing_hash, 1u);
    EXPECT_EQ(counts.failed, 1u);
    EXPECT_NE(captured.find("Failed to process broken.json"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "nohash.json"));
}

TEST_F(RenameTest, HashWithPathComponents_NotRenamed) {
    // Arrange: значение sha256 пытается выйти за пределы директории
    const auto reports_dir = test_dir_ / "reports";
    std::filesystem::create_directories(reports_dir);
    {
        std::ofstream file(reports_dir / "evil.json", std::ios::binary);
        file << report_with_sha256("../escaped");
    }
    {
        std::ofstream file(reports_dir / "short.json", std::ios::binary);
        file << report_with_sha256("abc123");
    }

    // Act
    ::testing::internal::CaptureStderr();
    output::Writer writer(output::OutputConfig{});
    RenameCounts counts = rename_reports(reports_dir, writer);
    std::string captured = ::testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(counts.renamed, 0u);
    EXPECT_EQ(counts.missing_hash, 2u);
    EXPECT_TRUE(std::filesystem::exists(reports_dir / "evil.json"));
    EXPECT_TRUE(std::filesystem::exists(reports_dir / "short.json"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "escaped.json"));
    EXPECT_NE(captured.find("Invalid SHA256 in evil.json"), std::string::npos);
}

TEST(RenameHelpersTest, IsSha256Digest) {
    EXPECT_TRUE(is_sha256_digest(SHA256_A));
    EXPECT_TRUE(is_sha256_digest(std::string(64, 'F')));
    EXPECT_FALSE(is_sha256_digest(""));
    EXPECT_FALSE(is_sha256_digest(SHA256_A.substr(1)));
    EXPECT_FALSE(is_sha256_digest(std::string(62, 'a') + "/."));
    EXPECT_FALSE(is_sha256_digest(std::string(64, 'g')));
}

TEST_F(RenameTest, MissingDirectory_Throws) {
    output::Writer writer(quiet());

    EXPECT_THROW(rename_reports(test_dir_ / "missing", writer), std::runtime_error);
}

}  // namespace curator::curate::test
