// ==============================================================================
// curator/classifier.hpp - Фаза 1: поиск некорректных отчётов
// ==============================================================================
//
// Назначение:
// - Классификация структурных дефектов отчёта (fatal / no_processes /
//   no_hooked_functions) в фиксированном порядке приоритета
// - Независимые флаги VirusTotal (no_vt / vt_error) для прошедших проверку
// - Карантин: перемещение дефектных отчётов в staging-директории
//
// Категории 1-3 взаимоисключающие. Флаги VT проверяются только у отчётов,
// прошедших структурные проверки.
//
// ==============================================================================

#ifndef CURATOR_CLASSIFIER_HPP
#define CURATOR_CLASSIFIER_HPP

#include <curator/staging.hpp>
#include <curator/value.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

// ----------------------------------------------------------------------------
// Категории
// ----------------------------------------------------------------------------

enum class ErrorCategory {
    Fatal,             // Нет поля "target" (или JSON не парсится)
    NoProcesses,       // behavior.processes пуст
    NoHookedFunctions  // calls первого процесса пуст
};

struct Classification {
    /// Структурный дефект (nullopt если отчёт прошёл проверки 1-3)
    std::optional<ErrorCategory> structural;

    bool no_vt = false;
    bool vt_error = false;

    bool excluded() const { return structural.has_value() || no_vt || vt_error; }
};

/// Классифицировать распарсенный отчёт
Classification classify(const Value& report);

// ----------------------------------------------------------------------------
// Результат фазы
// ----------------------------------------------------------------------------

struct ClassifierResult {
    std::vector<std::filesystem::path> fatal;
    std::vector<std::filesystem::path> no_processes;
    std::vector<std::filesystem::path> no_hooked_functions;
    std::vector<std::filesystem::path> no_vt;
    std::vector<std::filesystem::path> vt_error;

    /// Отчёты, которые не удалось переместить в карантин
    std::vector<std::filesystem::path> move_failures;

    /// Структурно дефектные отчёты (fatal + no_processes + no_hooked_functions)
    std::vector<std::filesystem::path> structural() const;

    /// Отчёты с проблемами VT (без повторов)
    std::vector<std::filesystem::path> vt_broken() const;
};

/// Прочитать и классифицировать отчёты без побочных эффектов на диске
ClassifierResult scan_reports(const std::vector<std::filesystem::path>& reports,
                              output::Writer& writer);

/// Записать reports_with_errors.json / reports_with_vt_errors.json и
/// переместить отчёты в карантин
/// @return отчёты, которые не удалось переместить
std::vector<std::filesystem::path> quarantine_reports(const ClassifierResult& result,
                                                      const StagingLayout& layout,
                                                      output::Writer& writer);

/// Полная фаза: scan_reports + quarantine_reports
ClassifierResult run_classifier(const std::vector<std::filesystem::path>& reports,
                                const StagingLayout& layout, output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_CLASSIFIER_HPP
