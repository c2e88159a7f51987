// ==============================================================================
// curator/report.hpp - Загрузка и сериализация отчётов песочницы
// ==============================================================================
//
// Назначение:
// - Report struct (распарсенный отчёт + путь + размер файла)
// - load_report(): чтение файла целиком и парсинг RapidJSON
// - serialize_report(): обратная сериализация (pretty, отступ 2)
// - write_json_file(): запись итоговых JSON-артефактов пайплайна
//
// Отчёт, который не удалось распарсить, трактуется классификатором как
// отчёт без поля "target" (категория fatal).
//
// ==============================================================================

#ifndef CURATOR_REPORT_HPP
#define CURATOR_REPORT_HPP

#include <curator/value.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace curator::io {

// ----------------------------------------------------------------------------
// Константы формата отчёта
// ----------------------------------------------------------------------------

/// Значение-заглушка "нет консенсуса" в полях detections / avclass_detection
constexpr const char* NA_SENTINEL = "(n/a)";

// ----------------------------------------------------------------------------
// Report - распарсенный отчёт
// ----------------------------------------------------------------------------

struct Report {
    /// Путь к файлу отчёта
    std::filesystem::path path;

    /// Содержимое документа
    Value data;

    /// Размер файла на диске (байты)
    std::uint64_t size = 0;
};

// ----------------------------------------------------------------------------
// ReportError - ошибки загрузки
// ----------------------------------------------------------------------------

enum class ReportErrorKind {
    FileNotFound,  // Файл не найден или не открывается
    ParseError,    // Некорректный JSON
    IoError        // Ошибка ввода-вывода
};

struct ReportError {
    ReportErrorKind kind = ReportErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load report '<path>' - <message>"
    std::string format() const;
};

struct ReportResult {
    bool ok = false;
    Report report;
    ReportError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить и распарсить отчёт
ReportResult load_report(const std::filesystem::path& path);

/// Распарсить отчёт из строки (path используется только в сообщениях)
ReportResult parse_report(std::string_view content, const std::filesystem::path& path);

/// Сериализовать документ: pretty=true - отступ 2 пробела, иначе компактно
std::string serialize_report(const Value& data, bool pretty = true);

/// Сериализовать RapidJSON документ с отступом indent пробелов
std::string serialize_json(const rapidjson::Value& value, unsigned indent = 4);

/// Записать JSON-артефакт (отступ 4 пробела) атомарно
/// @throws std::runtime_error при ошибке записи
void write_json_file(const std::filesystem::path& path, const rapidjson::Value& value);

}  // namespace curator::io

#endif  // CURATOR_REPORT_HPP
