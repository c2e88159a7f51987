// ==============================================================================
// curator/sanitizer.hpp - Фаза 3: санитизация и анонимизация отчётов
// ==============================================================================
//
// Назначение:
// - Удаление шумовых секций верхнего уровня
// - Редактирование environ в behavior.processes и рекурсивно в
//   behavior.processtree (смешанные узлы object/array)
// - Вставка detections = "(n/a)" при отсутствии поля
// - Текстовая замена терминов из внешнего списка
// - Пул рабочих потоков: один отчёт = одна независимая задача
//
// Отчёты переписываются на месте. Ошибка в одном отчёте не прерывает
// обработку остальных.
//
// ==============================================================================

#ifndef CURATOR_SANITIZER_HPP
#define CURATOR_SANITIZER_HPP

#include <curator/value.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

// ----------------------------------------------------------------------------
// SanitizeConfig - неизменяемый снимок параметров для рабочих потоков
// ----------------------------------------------------------------------------

struct SanitizeConfig {
    /// Секции верхнего уровня для удаления
    std::vector<std::string> sections_to_delete;

    /// Литеральные термины для замены
    std::vector<std::string> terms;

    /// Маркер для environ и заменённых терминов
    std::string redaction = "[REDACTED]";
};

struct SanitizeFailure {
    std::filesystem::path path;
    std::string message;
};

struct SanitizeResult {
    std::size_t processed = 0;
    std::vector<SanitizeFailure> failures;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Прочитать список терминов (по одному на строку, пустые строки пропускаются)
/// @return nullopt если файл не читается
std::optional<std::vector<std::string>> load_terms(const std::filesystem::path& path);

/// Заменить environ на маркер во всех узлах дерева процессов
void redact_process_tree(Value& node, const std::string& redaction);

/// Структурная санитизация документа на месте
void sanitize_document(Value& report, const SanitizeConfig& config);

/// Заменить каждое вхождение каждого термина на маркер
/// @return Количество замен
std::size_t anonymize_text(std::string& text, const std::vector<std::string>& terms,
                           const std::string& redaction);

/// Санитизировать один файл отчёта на месте
/// @throws std::runtime_error при ошибке чтения, парсинга или записи
void sanitize_report(const std::filesystem::path& path, const SanitizeConfig& config);

/// Запуск рабочего потока; бросает std::system_error, если поток не создан
using ThreadFactory = std::function<std::thread(std::function<void()>)>;

/// std::thread напрямую
const ThreadFactory& default_thread_factory();

/// Полная фаза: пул из min(workers, reports.size()) потоков.
/// Если часть потоков не запустилась, очередь разбирают запущенные;
/// если не запустился ни один, отчёты обрабатываются в вызывающем потоке.
SanitizeResult run_sanitizer(const std::vector<std::filesystem::path>& reports,
                             const SanitizeConfig& config, std::size_t workers,
                             output::Writer& writer, const ThreadFactory& make_thread = {});

}  // namespace curator::curate

#endif  // CURATOR_SANITIZER_HPP
