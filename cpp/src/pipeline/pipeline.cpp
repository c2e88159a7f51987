// ==============================================================================
// pipeline.cpp - Оркестратор: последовательный запуск фаз
// ==============================================================================

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <curator/classifier.hpp>
#include <curator/dedup.hpp>
#include <curator/discovery.hpp>
#include <curator/output.hpp>
#include <curator/pipeline.hpp>
#include <curator/platform.hpp>
#include <curator/sanitizer.hpp>
#include <curator/staging.hpp>
#include <curator/stats.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace curator::pipeline {

ReportSet collect_reports(const std::filesystem::path& json_dir) {
    ReportSet reports = io::discover_reports(json_dir, io::DiscoveryOptions{});
    if (reports.empty()) {
        throw std::runtime_error("No reports found in " + platform::path_to_utf8(json_dir));
    }
    return reports;
}

void remove_paths(ReportSet& reports, const std::vector<std::filesystem::path>& excluded) {
    if (excluded.empty()) {
        return;
    }
    std::unordered_set<std::string> drop;
    for (const auto& p : excluded) {
        drop.insert(p.string());
    }
    reports.erase(std::remove_if(reports.begin(), reports.end(),
                                 [&drop](const std::filesystem::path& p) {
                                     return drop.count(p.string()) > 0;
                                 }),
                  reports.end());
}

PipelineSummary run_pipeline(const std::filesystem::path& json_dir, const config::Config& cfg,
                             output::Writer& writer) {
    const auto started = std::chrono::steady_clock::now();

    ReportSet reports = collect_reports(json_dir);

    // Снимок для рабочих потоков санитайзера; файл терминов читается один раз
    curate::SanitizeConfig sanitize_cfg;
    sanitize_cfg.sections_to_delete = cfg.sections_to_delete;
    sanitize_cfg.redaction = cfg.redaction_marker;
    auto terms = curate::load_terms(cfg.terms_file);
    if (!terms.has_value()) {
        throw std::runtime_error("Could not read file with terms to anonymize - " +
                                 platform::path_to_utf8(cfg.terms_file));
    }
    sanitize_cfg.terms = std::move(*terms);

    const curate::StagingLayout layout(cfg.output_dir);

    PipelineSummary summary;
    summary.total_reports = reports.size();

    writer.info("Total workers: " + std::to_string(cfg.workers));
    writer.info("Total reports: " + std::to_string(reports.size()));
    writer.info("File with terms to anonymize: " + platform::path_to_utf8(cfg.terms_file) + " (" +
                std::to_string(sanitize_cfg.terms.size()) + " terms)");
    writer.info("VirusTotal positives threshold: " + std::to_string(cfg.vt_threshold));
    writer.info("Output directory: " + platform::path_to_utf8(cfg.output_dir));
    writer.rule("Starting pipeline");

    // Фаза 1
    curate::ClassifierResult errors = curate::run_classifier(reports, layout, writer);
    const auto structural = errors.structural();
    const auto vt_broken = errors.vt_broken();
    summary.with_errors = structural.size();
    summary.with_vt_errors = vt_broken.size();
    summary.quarantine_move_failures = errors.move_failures.size();
    remove_paths(reports, structural);
    remove_paths(reports, vt_broken);

    // Фаза 2
    curate::DedupResult dedup = curate::run_dedup(reports, cfg.keep_strategy, layout, writer);
    summary.duplicates = dedup.discarded.size();
    summary.quarantine_move_failures += dedup.move_failures.size();
    remove_paths(reports, dedup.discarded);

    // Фаза 3
    curate::SanitizeResult sanitized =
        curate::run_sanitizer(reports, sanitize_cfg, cfg.workers, writer);
    summary.sanitizer_failures = sanitized.failures.size();

    // Фаза 4
    if (reports.empty()) {
        writer.warn("No reports left after filtering, skipping statistics");
        summary.stats_skipped = true;
    } else {
        curate::StatsAccumulator stats =
            curate::run_stats(reports, cfg.vt_threshold, layout, writer);
        summary.undetected = stats.undetected.size();
        summary.no_cape_consensus = stats.no_cape_consensus.size();
        summary.no_avclass_consensus = stats.no_avclass_consensus.size();
    }

    summary.passed = reports.size();
    summary.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    writer.rule("Pipeline finished");
    return summary;
}

output::Table summary_table(const PipelineSummary& summary) {
    char elapsed[32];
    std::snprintf(elapsed, sizeof(elapsed), "%.2f seconds", summary.elapsed_seconds);

    output::Table table;
    table.set_headers({"Metric", "Value"});
    table.add_row({"Execution time", elapsed});
    table.add_row({"Reports passing all phases", std::to_string(summary.passed)});
    table.add_row({"Reports with errors", std::to_string(summary.with_errors)});
    table.add_row({"Reports with VirusTotal errors", std::to_string(summary.with_vt_errors)});
    table.add_row({"Duplicate reports", std::to_string(summary.duplicates)});
    table.add_row({"Undetected reports", std::to_string(summary.undetected)});
    table.add_row({"Reports with no CAPE consensus", std::to_string(summary.no_cape_consensus)});
    table.add_row(
        {"Reports with no AVClass consensus", std::to_string(summary.no_avclass_consensus)});
    table.add_row({"Sanitizer failures", std::to_string(summary.sanitizer_failures)});
    table.add_row(
        {"Quarantine move failures", std::to_string(summary.quarantine_move_failures)});
    return table;
}

}  // namespace curator::pipeline
