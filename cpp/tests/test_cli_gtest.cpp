// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "curator/cli.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace curator::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// --help / --version
// ==============================================================================

TEST(CliTest, Parse_NoArgs_HelpToStderrExit2) {
    Args args{"curator"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: curator"), std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"curator", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_SubcommandHelp_ReturnsHelpForCommand) {
    Args args{"curator", "run", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::string("run"));
}

TEST(CliTest, Parse_HelpSubcommand_WithName) {
    Args args{"curator", "help", "stats"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::string("stats"));
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"curator", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "curator 1.0.0\n");
}

TEST(CliTest, RenderHelp_KnownAndUnknownCommands) {
    EXPECT_NE(render_help().find("Commands:"), std::string::npos);
    EXPECT_NE(render_help(std::string("sanitize")).find("--anonymize-terms"), std::string::npos);
    EXPECT_NE(render_help(std::string("nope")).find("unrecognized subcommand"),
              std::string::npos);
}

// ==============================================================================
// Подкоманды и опции
// ==============================================================================

TEST(CliTest, Parse_Run_AllOptions) {
    // Arrange
    Args args{"curator", "-q",  "run", "reports", "-w",           "4",
              "-d",      "first", "-vt", "5",     "--output=out", "-a", "terms.txt"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(std::holds_alternative<RunCommand>(result.command));
    const auto& cmd = std::get<RunCommand>(result.command);
    EXPECT_EQ(cmd.json_dir, std::filesystem::path("reports"));
    EXPECT_EQ(cmd.options.workers, std::size_t{4});
    EXPECT_EQ(cmd.options.duplicates, config::KeepStrategy::First);
    EXPECT_EQ(cmd.options.vt_threshold, std::int64_t{5});
    EXPECT_EQ(cmd.options.output, std::filesystem::path("out"));
    EXPECT_EQ(cmd.options.anonymize_terms, std::filesystem::path("terms.txt"));
    EXPECT_FALSE(cmd.options.config.has_value());
}

TEST(CliTest, Parse_Run_VerboseRepeatable) {
    Args args{"curator", "-v", "run", "reports", "-v"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 2);
}

TEST(CliTest, Parse_Stats_VtPositivesAlias) {
    Args args{"curator", "stats", "reports", "--vt-positives-threshold", "20"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<StatsCommand>(result.command).options.vt_threshold, std::int64_t{20});
}

TEST(CliTest, Parse_Rename_OnlyDirectory) {
    Args args{"curator", "rename", "reports"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<RenameCommand>(result.command).json_dir,
              std::filesystem::path("reports"));
}

TEST(CliTest, Parse_OptionNotAcceptedBySubcommand_Exit2) {
    Args args{"curator", "rename", "reports", "-w", "4"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '-w'"),
              std::string::npos);
}

// ==============================================================================
// Ошибки разбора
// ==============================================================================

TEST(CliTest, Parse_MissingJsonDir_Exit2) {
    Args args{"curator", "run"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("<JSON_DIR>"), std::string::npos);
}

TEST(CliTest, Parse_InvalidWorkers_Exit2) {
    Args zero{"curator", "run", "reports", "-w", "0"};
    Args text{"curator", "run", "reports", "--workers", "ten"};

    ParseResult r1 = parse(zero.argc(), zero.argv());
    ParseResult r2 = parse(text.argc(), text.argv());

    EXPECT_FALSE(r1.ok);
    EXPECT_EQ(r1.diagnostic.exit_code, 2);
    EXPECT_FALSE(r2.ok);
    EXPECT_NE(r2.diagnostic.stderr_message.find("invalid value 'ten'"), std::string::npos);
}

TEST(CliTest, Parse_InvalidDuplicates_Exit2) {
    Args args{"curator", "duplicates", "reports", "-d", "largest"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("possible values: first, biggest"),
              std::string::npos);
}

TEST(CliTest, Parse_MissingOptionValue_Exit2) {
    Args args{"curator", "stats", "reports", "--vt-threshold"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("a value is required"), std::string::npos);
}

TEST(CliTest, Parse_UnknownSubcommand_Exit2) {
    Args args{"curator", "frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unrecognized subcommand 'frobnicate'"),
              std::string::npos);
}

TEST(CliTest, Parse_TwoDirectories_Exit2) {
    Args args{"curator", "errors", "a", "b"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

// ==============================================================================
// extract
// ==============================================================================

TEST(CliTest, Parse_Extract_Defaults) {
    Args args{"curator", "extract", "reports"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<ExtractCommand>(result.command));
    const auto& cmd = std::get<ExtractCommand>(result.command);
    EXPECT_EQ(cmd.json_dir, std::filesystem::path("reports"));
    EXPECT_EQ(cmd.options.label, curate::LabelSource::AVClass);
    EXPECT_EQ(cmd.options.order, curate::SelectionOrder::Random);
    EXPECT_EQ(cmd.options.count, 100u);
    EXPECT_TRUE(cmd.options.include.empty());
    EXPECT_EQ(cmd.options.output_dir, std::filesystem::path("extracted_reports"));
    EXPECT_FALSE(cmd.options.mapping.has_value());
}

TEST(CliTest, Parse_Extract_AllOptions) {
    Args args{"curator", "extract", "reports", "-l", "C", "-i", "Reline, Disabler", "-n", "5",
              "-c", "f", "-o", "picked", "--seed", "42"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = std::get<ExtractCommand>(result.command);
    EXPECT_EQ(cmd.options.label, curate::LabelSource::Cape);
    EXPECT_EQ(cmd.options.include, (std::vector<std::string>{"Reline", "Disabler"}));
    EXPECT_EQ(cmd.options.count, 5u);
    EXPECT_EQ(cmd.options.order, curate::SelectionOrder::FirstFound);
    EXPECT_EQ(cmd.options.output_dir, std::filesystem::path("picked"));
    EXPECT_EQ(cmd.options.seed, std::optional<std::uint32_t>(42));
}

TEST(CliTest, Parse_Extract_InvalidLabel_Exit2) {
    Args args{"curator", "extract", "reports", "--label", "X"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("possible values: A, C"), std::string::npos);
}

TEST(CliTest, Parse_Extract_ZeroCount_Exit2) {
    Args args{"curator", "extract", "reports", "-n", "0"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_Extract_MappingWithoutInclude_Exit2) {
    Args args{"curator", "extract", "reports", "--mapping", "labels.json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("--include <FAMILIES>"), std::string::npos);
}

TEST(CliTest, Parse_Extract_ConfigOptionRejected) {
    Args args{"curator", "extract", "reports", "--config", "curator.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--config'"),
              std::string::npos);
}

// ==============================================================================
// effective_config
// ==============================================================================

class EffectiveConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("curator_cli_") + test_info->test_case_name() +
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
};

TEST_F(EffectiveConfigTest, NoOptions_Defaults) {
    auto result = effective_config(PhaseOptions{});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.workers, config::DEFAULT_WORKERS);
    EXPECT_EQ(result.config.keep_strategy, config::KeepStrategy::Biggest);
}

TEST_F(EffectiveConfigTest, CliOverridesConfigFile) {
    // Arrange
    auto path = test_dir_ / "curator.yml";
    {
        std::ofstream file(path);
        file << "workers: 2\nvt_threshold: 30\nduplicates: first\n";
    }
    PhaseOptions options;
    options.config = path;
    options.workers = 8;

    // Act
    auto result = effective_config(options);

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.workers, 8u);
    EXPECT_EQ(result.config.vt_threshold, 30);
    EXPECT_EQ(result.config.keep_strategy, config::KeepStrategy::First);
}

TEST_F(EffectiveConfigTest, MissingConfigFile_Fails) {
    PhaseOptions options;
    options.config = test_dir_ / "missing.yml";

    auto result = effective_config(options);

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
}

}  // namespace curator::cli::test
