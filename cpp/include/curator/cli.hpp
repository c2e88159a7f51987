// ==============================================================================
// curator/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI в стиле clap (exit code 2)
// - Сборка эффективной конфигурации: умолчания < --config < опции
//
// ==============================================================================

#ifndef CURATOR_CLI_HPP
#define CURATOR_CLI_HPP

#include <curator/config.hpp>
#include <curator/extract.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace curator::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q, -s, --silent
};

// ----------------------------------------------------------------------------
// Опции фаз (общие для run и отдельных фаз)
// ----------------------------------------------------------------------------

struct PhaseOptions {
    std::optional<std::size_t> workers;                  // -w, --workers
    std::optional<config::KeepStrategy> duplicates;      // -d, --duplicates
    std::optional<std::int64_t> vt_threshold;            // --vt-threshold, -vt
    std::optional<std::filesystem::path> anonymize_terms;  // -a, --anonymize-terms
    std::optional<std::filesystem::path> output;         // -o, --output
    std::optional<std::filesystem::path> config;         // -c, --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// run - полный пайплайн
struct RunCommand {
    std::filesystem::path json_dir;
    PhaseOptions options;
};

/// errors - только классификация некорректных отчётов
struct ErrorsCommand {
    std::filesystem::path json_dir;
    PhaseOptions options;
};

/// duplicates - только разрешение дубликатов
struct DuplicatesCommand {
    std::filesystem::path json_dir;
    PhaseOptions options;
};

/// sanitize - только санитизация и анонимизация
struct SanitizeCommand {
    std::filesystem::path json_dir;
    PhaseOptions options;
};

/// stats - только статистика
struct StatsCommand {
    std::filesystem::path json_dir;
    PhaseOptions options;
};

/// rename - переименование отчётов в <sha256>.json
struct RenameCommand {
    std::filesystem::path json_dir;
};

/// extract - копирование выборки отчётов по семействам
struct ExtractCommand {
    std::filesystem::path json_dir;
    curate::ExtractOptions options;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, ErrorsCommand, DuplicatesCommand, SanitizeCommand,
                             StatsCommand, RenameCommand, ExtractCommand, HelpCommand,
                             VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Эффективная конфигурация: умолчания, затем --config, затем опции
config::ConfigResult effective_config(const PhaseOptions& options);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT =
    "Curate sandbox execution reports into a clean, deduplicated and sanitized dataset";

}  // namespace curator::cli

#endif  // CURATOR_CLI_HPP
