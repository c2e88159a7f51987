// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Сборка конфигурации и dispatch команды
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка использования
//
// ==============================================================================

#include "curator/classifier.hpp"
#include "curator/cli.hpp"
#include "curator/config.hpp"
#include "curator/dedup.hpp"
#include "curator/extract.hpp"
#include "curator/output.hpp"
#include "curator/pipeline.hpp"
#include "curator/platform.hpp"
#include "curator/rename.hpp"
#include "curator/sanitizer.hpp"
#include "curator/staging.hpp"
#include "curator/stats.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
     ██████╗██╗   ██╗██████╗  █████╗ ████████╗ ██████╗ ██████╗
    ██╔════╝██║   ██║██╔══██╗██╔══██╗╚══██╔══╝██╔═══██╗██╔══██╗
    ██║     ██║   ██║██████╔╝███████║   ██║   ██║   ██║██████╔╝
    ██║     ██║   ██║██╔══██╗██╔══██║   ██║   ██║   ██║██╔══██╗
    ╚██████╗╚██████╔╝██║  ██║██║  ██║   ██║   ╚██████╔╝██║  ██║
     ╚═════╝ ╚═════╝ ╚═╝  ╚═╝╚═╝  ╚═╝   ╚═╝    ╚═════╝ ╚═╝  ╚═╝
)";

void print_banner(curator::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(curator::output::Stream::Stderr, BANNER);
    writer.write_line(curator::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Конфигурация
// ----------------------------------------------------------------------------

/// Собрать конфигурацию; nullopt если она некорректна (ошибка уже выведена)
std::optional<curator::config::Config> load_effective_config(
    const curator::cli::PhaseOptions& options, curator::output::Writer& writer) {
    auto result = curator::cli::effective_config(options);
    for (const auto& warning : result.warnings) {
        writer.warn(warning);
    }
    if (!result.ok) {
        writer.error(result.error);
        return std::nullopt;
    }
    return result.config;
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_run(const curator::cli::RunCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    auto cfg = load_effective_config(cmd.options, writer);
    if (!cfg) {
        return 1;
    }

    writer.rule("CURATOR");
    pipeline::PipelineSummary summary = pipeline::run_pipeline(cmd.json_dir, *cfg, writer);

    pipeline::summary_table(summary).print(writer);
    writer.rule("CURATOR");
    return 0;
}

int run_errors(const curator::cli::ErrorsCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    auto cfg = load_effective_config(cmd.options, writer);
    if (!cfg) {
        return 1;
    }

    auto reports = pipeline::collect_reports(cmd.json_dir);
    const curate::StagingLayout layout(cfg->output_dir);
    curate::ClassifierResult result = curate::run_classifier(reports, layout, writer);

    output::Table table;
    table.set_headers({"Category", "Reports"});
    table.add_row({"Fatal reports", std::to_string(result.fatal.size())});
    table.add_row({"Reports with no processes", std::to_string(result.no_processes.size())});
    table.add_row(
        {"Reports with no hooked functions", std::to_string(result.no_hooked_functions.size())});
    table.add_row({"Reports with no VT entry", std::to_string(result.no_vt.size())});
    table.add_row({"Reports with VT error", std::to_string(result.vt_error.size())});
    table.add_row({"Quarantine move failures", std::to_string(result.move_failures.size())});
    table.print(writer);
    return 0;
}

int run_duplicates(const curator::cli::DuplicatesCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    auto cfg = load_effective_config(cmd.options, writer);
    if (!cfg) {
        return 1;
    }

    auto reports = pipeline::collect_reports(cmd.json_dir);
    const curate::StagingLayout layout(cfg->output_dir);
    curate::DedupResult result = curate::run_dedup(reports, cfg->keep_strategy, layout, writer);

    writer.info("Duplicate groups: " + std::to_string(result.groups.size()));
    writer.info("Duplicate reports: " + std::to_string(result.discarded.size()));
    if (!result.move_failures.empty()) {
        writer.warn("Duplicate reports left in place: " +
                    std::to_string(result.move_failures.size()));
    }
    return 0;
}

int run_sanitize(const curator::cli::SanitizeCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    auto cfg = load_effective_config(cmd.options, writer);
    if (!cfg) {
        return 1;
    }

    auto reports = pipeline::collect_reports(cmd.json_dir);

    curate::SanitizeConfig sanitize_cfg;
    sanitize_cfg.sections_to_delete = cfg->sections_to_delete;
    sanitize_cfg.redaction = cfg->redaction_marker;
    auto terms = curate::load_terms(cfg->terms_file);
    if (!terms) {
        writer.error("Could not read file with terms to anonymize - " +
                     platform::path_to_utf8(cfg->terms_file));
        return 1;
    }
    sanitize_cfg.terms = std::move(*terms);

    curate::SanitizeResult result = curate::run_sanitizer(reports, sanitize_cfg, cfg->workers,
                                                          writer);
    writer.info("Sanitized reports: " + std::to_string(result.processed));
    if (!result.failures.empty()) {
        writer.warn("Reports that could not be sanitized: " +
                    std::to_string(result.failures.size()));
    }
    return 0;
}

int run_stats(const curator::cli::StatsCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    auto cfg = load_effective_config(cmd.options, writer);
    if (!cfg) {
        return 1;
    }

    auto reports = pipeline::collect_reports(cmd.json_dir);
    const curate::StagingLayout layout(cfg->output_dir);
    curate::StatsAccumulator stats = curate::run_stats(reports, cfg->vt_threshold, layout, writer);

    writer.info("Undetected reports: " + std::to_string(stats.undetected.size()));
    writer.info("Reports with no CAPE consensus: " +
                std::to_string(stats.no_cape_consensus.size()));
    writer.info("Reports with no AVClass consensus: " +
                std::to_string(stats.no_avclass_consensus.size()));
    return 0;
}

int run_rename(const curator::cli::RenameCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    curate::RenameCounts counts = curate::rename_reports(cmd.json_dir, writer);
    writer.info("Renamed: " + std::to_string(counts.renamed) +
                ", skipped: " + std::to_string(counts.skipped) +
                ", without sha256: " + std::to_string(counts.missing_hash) +
                ", failed: " + std::to_string(counts.failed));
    return counts.failed > 0 ? 1 : 0;
}

int run_extract(const curator::cli::ExtractCommand& cmd, curator::output::Writer& writer) {
    using namespace curator;

    curate::ExtractResult result = curate::run_extract(cmd.json_dir, cmd.options, writer);

    output::Table table;
    table.set_headers({"Family", "Reports"});
    for (const auto& family : result.selected) {
        table.add_row({family.family, std::to_string(family.reports.size())});
    }
    table.print(writer);

    if (result.unreadable > 0) {
        writer.warn("Unreadable reports skipped: " + std::to_string(result.unreadable));
    }
    return result.failed > 0 ? 1 : 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace curator;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Сообщение парсера идёт без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    try {
        return std::visit(
            [&](auto&& cmd) -> int {
                using T = std::decay_t<decltype(cmd)>;

                if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                    writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                    return 0;
                } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                    writer.write(output::Stream::Stdout, cli::render_version());
                    return 0;
                } else if constexpr (std::is_same_v<T, cli::RunCommand>) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                    return run_run(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::ErrorsCommand>) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                    return run_errors(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::DuplicatesCommand>) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                    return run_duplicates(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::SanitizeCommand>) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                    return run_sanitize(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::StatsCommand>) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                    return run_stats(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::ExtractCommand>) {
                    return run_extract(cmd, writer);
                } else {
                    static_assert(std::is_same_v<T, cli::RenameCommand>);
                    return run_rename(cmd, writer);
                }
            },
            parse_result.command);
    } catch (const curate::PreconditionError& e) {
        writer.error(std::string("precondition violated: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        writer.error(e.what());
        return 1;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
