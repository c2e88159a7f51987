// ==============================================================================
// curator/stats.hpp - Фаза 4: статистика по итоговому набору отчётов
// ==============================================================================
//
// Назначение:
// - ExtremumTracker: running min/max с отчётом-примером (первый встреченный
//   при равенстве сохраняет слот)
// - LabelCounter: частоты меток семейств, most_common по убыванию
// - StatsAccumulator: все счётчики одного прогона
// - StatsAggregator: обновление аккумулятора по отчёту
// - Запись reports_statistics.json, undetected_or_benign_reports.json,
//   unlabeled_reports.json
//
// Деление для средних откладывается до формирования итогового JSON.
//
// ==============================================================================

#ifndef CURATOR_STATS_HPP
#define CURATOR_STATS_HPP

#include <curator/staging.hpp>
#include <curator/value.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

// ----------------------------------------------------------------------------
// ExtremumTracker
// ----------------------------------------------------------------------------

/// Монотонный трекер экстремума со значением-примером
///
/// Первое обновление всегда занимает слот, далее только при строгом
/// Compare(value, current).
template <typename T, typename Compare>
class ExtremumTracker {
public:
    /// @return true если значение заняло слот
    bool update(const T& value, const std::filesystem::path& exemplar) {
        if (!has_value_ || Compare{}(value, value_)) {
            value_ = value;
            exemplar_ = exemplar;
            has_value_ = true;
            return true;
        }
        return false;
    }

    bool has_value() const { return has_value_; }
    const T& value() const { return value_; }
    const std::filesystem::path& exemplar() const { return exemplar_; }

private:
    bool has_value_ = false;
    T value_{};
    std::filesystem::path exemplar_;
};

template <typename T>
using MinTracker = ExtremumTracker<T, std::less<T>>;

template <typename T>
using MaxTracker = ExtremumTracker<T, std::greater<T>>;

// ----------------------------------------------------------------------------
// LabelCounter
// ----------------------------------------------------------------------------

class LabelCounter {
public:
    void add(const std::string& label);

    std::size_t count(const std::string& label) const;

    /// Метки по убыванию частоты; при равенстве - порядок первого появления
    std::vector<std::pair<std::string, std::size_t>> most_common() const;

    std::size_t distinct() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<std::pair<std::string, std::size_t>> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// Нормализация метки: первая буква заглавная, остальное без изменений
std::string capitalize_label(std::string_view label);

// ----------------------------------------------------------------------------
// StatsAccumulator
// ----------------------------------------------------------------------------

struct StatsAccumulator {
    std::int64_t vt_threshold = 10;
    std::size_t total_reports = 0;

    // Процессы
    std::uint64_t total_spawned_processes = 0;
    MinTracker<std::uint64_t> min_spawned_processes;
    MaxTracker<std::uint64_t> max_spawned_processes;

    // Перехваченные функции (на процесс)
    std::uint64_t total_hooked_functions = 0;
    MinTracker<std::uint64_t> min_hooked_functions;
    MaxTracker<std::uint64_t> max_hooked_functions;

    // VirusTotal
    std::int64_t total_vt_positives = 0;
    MinTracker<std::int64_t> min_vt_positives;
    MaxTracker<std::int64_t> max_vt_positives;

    // Метки
    LabelCounter cape_labels;
    LabelCounter avclass_labels;

    std::vector<std::filesystem::path> undetected;
    std::vector<std::filesystem::path> no_cape_consensus;
    std::vector<std::filesystem::path> no_avclass_consensus;

    /// total_spawned_processes / total_reports (nullopt при нуле отчётов)
    std::optional<double> average_spawned_processes() const;

    /// total_hooked_functions / total_spawned_processes
    std::optional<double> average_hooked_functions() const;

    /// total_vt_positives / total_reports
    std::optional<double> average_vt_positives() const;
};

// ----------------------------------------------------------------------------
// StatsAggregator
// ----------------------------------------------------------------------------

class StatsAggregator {
public:
    explicit StatsAggregator(std::int64_t vt_threshold);

    /// Учесть отчёт; writer для предупреждений (может быть nullptr)
    void add_report(const Value& report, const std::filesystem::path& path,
                    output::Writer* writer = nullptr);

    /// Учесть отчёт, который не удалось прочитать (только в total_reports)
    void add_unreadable();

    const StatsAccumulator& current() const { return acc_; }

    /// Передать аккумулятор владельцу; агрегатор после вызова пуст
    StatsAccumulator take();

private:
    StatsAccumulator acc_;
};

// ----------------------------------------------------------------------------
// Артефакты
// ----------------------------------------------------------------------------

/// Сформировать reports_statistics.json
rapidjson::Document summary_to_json(const StatsAccumulator& acc);

/// Ключ в undetected_or_benign_reports.json
std::string undetected_key(std::int64_t vt_threshold);

/// Записать три JSON-артефакта в results/
void write_stats_results(const StatsAccumulator& acc, const StagingLayout& layout,
                         output::Writer& writer);

/// Полная фаза: чтение отчётов, агрегация, запись артефактов
StatsAccumulator run_stats(const std::vector<std::filesystem::path>& reports,
                           std::int64_t vt_threshold, const StagingLayout& layout,
                           output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_STATS_HPP
