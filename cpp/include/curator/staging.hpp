// ==============================================================================
// curator/staging.hpp - Раскладка выходных директорий пайплайна
// ==============================================================================
//
// <output>/
//   reports_with_errors/
//     reports_with_errors.json, reports_with_vt_errors.json
//     reports_with_errors/, reports_with_vt_errors/
//   duplicate_reports/
//     duplicate_reports.json
//     duplicate_reports/
//   results/
//     reports_statistics.json, undetected_or_benign_reports.json,
//     unlabeled_reports.json
//
// ==============================================================================

#ifndef CURATOR_STAGING_HPP
#define CURATOR_STAGING_HPP

#include <filesystem>
#include <rapidjson/document.h>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

class StagingLayout {
public:
    explicit StagingLayout(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Фаза 1: ошибки
    std::filesystem::path errors_dir() const;
    std::filesystem::path errors_json() const;
    std::filesystem::path vt_errors_json() const;
    std::filesystem::path errors_quarantine() const;
    std::filesystem::path vt_errors_quarantine() const;

    // Фаза 2: дубликаты
    std::filesystem::path duplicates_dir() const;
    std::filesystem::path duplicates_json() const;
    std::filesystem::path duplicates_quarantine() const;

    // Фаза 4: статистика
    std::filesystem::path results_dir() const;
    std::filesystem::path statistics_json() const;
    std::filesystem::path undetected_json() const;
    std::filesystem::path unlabeled_json() const;

private:
    std::filesystem::path root_;
};

/// Список путей -> JSON-массив строк UTF-8 (для артефактов фаз)
rapidjson::Value paths_to_json(const std::vector<std::filesystem::path>& paths,
                               rapidjson::Document::AllocatorType& alloc);

/// Переместить отчёты в карантинную директорию (создаётся при необходимости).
/// Ошибки пишутся в writer и не прерывают перемещение остальных.
/// @return отчёты, которые остались на месте
std::vector<std::filesystem::path> move_to_quarantine(
    const std::vector<std::filesystem::path>& reports, const std::filesystem::path& quarantine,
    output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_STAGING_HPP
