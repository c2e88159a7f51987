// ==============================================================================
// curator/config.hpp - Параметры запуска пайплайна
// ==============================================================================
//
// Назначение:
// - Config struct: все эффективные параметры запуска
// - Значения по умолчанию
// - Загрузка YAML-файла конфигурации (yaml-cpp)
// - Валидация
//
// Порядок приоритетов: значения по умолчанию < YAML-файл < аргументы CLI.
//
// ==============================================================================

#ifndef CURATOR_CONFIG_HPP
#define CURATOR_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace curator::config {

// ----------------------------------------------------------------------------
// KeepStrategy - какой отчёт оставлять в группе дубликатов
// ----------------------------------------------------------------------------

enum class KeepStrategy {
    First,   // Первый встреченный
    Biggest  // Наибольший по размеру файла
};

/// "first" / "biggest" -> KeepStrategy
std::optional<KeepStrategy> parse_keep_strategy(std::string_view s);

/// KeepStrategy -> "first" / "biggest"
std::string keep_strategy_to_string(KeepStrategy strategy);

// ----------------------------------------------------------------------------
// Значения по умолчанию
// ----------------------------------------------------------------------------

constexpr std::size_t DEFAULT_WORKERS = 10;
constexpr std::int64_t DEFAULT_VT_THRESHOLD = 10;
constexpr const char* DEFAULT_TERMS_FILE = "terms_to_anonymize.txt";
constexpr const char* DEFAULT_REDACTION_MARKER = "[REDACTED]";

/// Секции верхнего уровня, удаляемые санитайзером по умолчанию
std::vector<std::string> default_sections_to_delete();

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

struct Config {
    std::size_t workers = DEFAULT_WORKERS;
    KeepStrategy keep_strategy = KeepStrategy::Biggest;
    std::int64_t vt_threshold = DEFAULT_VT_THRESHOLD;
    std::filesystem::path terms_file = DEFAULT_TERMS_FILE;
    std::vector<std::string> sections_to_delete = default_sections_to_delete();
    std::filesystem::path output_dir = ".";
    std::string redaction_marker = DEFAULT_REDACTION_MARKER;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;

    /// Предупреждения (неизвестные ключи)
    std::vector<std::string> warnings;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить YAML-файл поверх base
///
/// Неизвестные ключи попадают в warnings, неверные типы значений - ошибка.
ConfigResult load_config_file(const std::filesystem::path& path, const Config& base = Config{});

/// Разобрать YAML из строки поверх base
ConfigResult parse_config(std::string_view yaml, const Config& base = Config{});

/// Проверить согласованность параметров
/// @return Пустая строка если всё корректно, иначе текст ошибки
std::string validate(const Config& config);

}  // namespace curator::config

#endif  // CURATOR_CONFIG_HPP
