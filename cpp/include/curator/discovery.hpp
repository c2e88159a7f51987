// ==============================================================================
// curator/discovery.hpp - Поиск JSON-отчётов во входной директории
// ==============================================================================
//
// Назначение:
// - Перечисление файлов *.json во входной директории (по умолчанию без рекурсии,
//   чтобы не подхватить staging-директории предыдущих запусков)
// - Детерминированный порядок результатов (сортировка по пути)
// - Режим skip_errors: предупреждение вместо исключения
//
// ==============================================================================

#ifndef CURATOR_DISCOVERY_HPP
#define CURATOR_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска отчётов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Расширение отчётов БЕЗ точки, сравнение case-sensitive
    std::string extension = "json";

    /// Обходить поддиректории
    bool recursive = false;

    /// true = предупреждение через Writer вместо исключения
    bool skip_errors = false;
};

// ----------------------------------------------------------------------------
// discover_reports - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти файлы отчётов в директории
///
/// @param dir Директория с отчётами
/// @param opt Параметры поиска
/// @param writer Куда писать предупреждения при skip_errors (может быть nullptr)
/// @return Отсортированный по пути список отчётов; пустой результат - не ошибка
///
/// @throws std::runtime_error если директория не существует или недоступна
///         (при skip_errors=false)
std::vector<std::filesystem::path> discover_reports(const std::filesystem::path& dir,
                                                    const DiscoveryOptions& opt,
                                                    output::Writer* writer = nullptr);

}  // namespace curator::io

#endif  // CURATOR_DISCOVERY_HPP
