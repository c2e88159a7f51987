// ==============================================================================
// curator/pipeline.hpp - Оркестратор: последовательный запуск фаз
// ==============================================================================
//
// Назначение:
// - Владение набором отчётов (ReportSet), который только сокращается
// - Порядок фаз: классификация -> дубликаты -> санитизация -> статистика
// - Итоговая сводка прогона
//
// Фазы строго последовательны; параллельна только санитизация внутри себя.
//
// ==============================================================================

#ifndef CURATOR_PIPELINE_HPP
#define CURATOR_PIPELINE_HPP

#include <curator/config.hpp>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace curator::output {
class Writer;
class Table;
}  // namespace curator::output

namespace curator::pipeline {

using ReportSet = std::vector<std::filesystem::path>;

struct PipelineSummary {
    double elapsed_seconds = 0.0;
    std::size_t total_reports = 0;
    std::size_t passed = 0;
    std::size_t with_errors = 0;
    std::size_t with_vt_errors = 0;
    std::size_t duplicates = 0;
    std::size_t undetected = 0;
    std::size_t no_cape_consensus = 0;
    std::size_t no_avclass_consensus = 0;
    std::size_t sanitizer_failures = 0;
    std::size_t quarantine_move_failures = 0;
    bool stats_skipped = false;
};

/// Найти отчёты во входной директории
/// @throws std::runtime_error если директория недоступна или отчётов нет
ReportSet collect_reports(const std::filesystem::path& json_dir);

/// Удалить из набора пути из excluded (порядок остальных сохраняется)
void remove_paths(ReportSet& reports, const std::vector<std::filesystem::path>& excluded);

/// Запустить все фазы
/// @throws std::runtime_error при отсутствии отчётов или файла терминов
/// @throws curate::PreconditionError при нарушении контракта фаз
PipelineSummary run_pipeline(const std::filesystem::path& json_dir, const config::Config& cfg,
                             output::Writer& writer);

/// Таблица итоговой сводки
output::Table summary_table(const PipelineSummary& summary);

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_HPP
