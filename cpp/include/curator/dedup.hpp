// ==============================================================================
// curator/dedup.hpp - Фаза 2: разрешение дубликатов
// ==============================================================================
//
// Назначение:
// - Группировка отчётов по target.file.sha512 за один проход
// - Выбор сохраняемого отчёта в группе (KeepStrategy first / biggest)
// - Перемещение отброшенных отчётов в duplicate_reports/duplicate_reports/
//
// Группа материализуется только при втором появлении хэша и засевается
// первым встреченным отчётом. Хэш, встреченный один раз, группы не образует.
//
// ==============================================================================

#ifndef CURATOR_DEDUP_HPP
#define CURATOR_DEDUP_HPP

#include <curator/config.hpp>
#include <curator/staging.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

// ----------------------------------------------------------------------------
// PreconditionError - нарушение контракта между фазами
// ----------------------------------------------------------------------------

class PreconditionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Типы
// ----------------------------------------------------------------------------

/// Отчёт с извлечённым хэшем
struct HashedReport {
    std::filesystem::path path;
    std::string sha512;
    std::uint64_t size = 0;
};

struct GroupMember {
    std::filesystem::path path;
    std::uint64_t size = 0;
};

/// Группа отчётов с одинаковым sha512 (всегда >= 2 участников)
struct DuplicateGroup {
    std::string hash;
    std::vector<GroupMember> members;
};

/// Решение по группе: индексы в DuplicateGroup::members
struct GroupResolution {
    std::size_t kept = 0;
    std::vector<std::size_t> discarded;
};

struct DedupResult {
    /// Группы в порядке их материализации
    std::vector<DuplicateGroup> groups;

    /// Отброшенные отчёты (удаляются из набора)
    std::vector<std::filesystem::path> discarded;

    /// Отброшенные отчёты, которые не удалось переместить в карантин
    std::vector<std::filesystem::path> move_failures;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Сгруппировать отчёты по хэшу (без обращения к диску)
std::vector<DuplicateGroup> group_duplicates(const std::vector<HashedReport>& reports);

/// Выбрать сохраняемый отчёт
///
/// biggest: running max по размеру со строгим сравнением, при равенстве
/// остаётся встреченный раньше.
GroupResolution resolve_group(const DuplicateGroup& group, config::KeepStrategy strategy);

/// Прочитать хэши отчётов
///
/// Нераспарсенные отчёты пропускаются с сообщением об ошибке.
/// @throws PreconditionError если у отчёта нет target.file.sha512
std::vector<HashedReport> read_hashes(const std::vector<std::filesystem::path>& reports,
                                      output::Writer& writer);

/// Полная фаза: хэши, группы, duplicate_reports.json, перемещение отброшенных
/// @throws PreconditionError если у отчёта нет target.file.sha512
DedupResult run_dedup(const std::vector<std::filesystem::path>& reports,
                      config::KeepStrategy strategy, const StagingLayout& layout,
                      output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_DEDUP_HPP
