// ==============================================================================
// curator/extract.hpp - Выборка отчётов по меткам семейств
// ==============================================================================
//
// Назначение:
// - Выбор до N отчётов на семейство по метке AVClass или CAPE
// - Списки включаемых и исключаемых семейств
// - Порядок выбора: случайный (перемешивание) или первые найденные
// - Альтернативный источник: JSON-маппинг меток {family: {n_reports, reports}}
// - Копирование выбранных отчётов в выходную директорию
//
// Входная директория не изменяется.
//
// ==============================================================================

#ifndef CURATOR_EXTRACT_HPP
#define CURATOR_EXTRACT_HPP

#include <curator/value.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace curator::output {
class Writer;
}

namespace curator::curate {

// ----------------------------------------------------------------------------
// Опции
// ----------------------------------------------------------------------------

enum class LabelSource {
    AVClass,  // avclass_detection
    Cape      // detections[0].family
};

enum class SelectionOrder {
    Random,     // отчёты перемешиваются перед выбором
    FirstFound  // порядок обнаружения
};

/// "A"/"avclass" или "C"/"cape" (регистр не важен)
std::optional<LabelSource> parse_label_source(std::string_view s);

/// "r"/"random" или "f"/"first"
std::optional<SelectionOrder> parse_selection_order(std::string_view s);

struct ExtractOptions {
    LabelSource label = LabelSource::AVClass;

    /// Пусто: все семейства, тогда count ограничивает общее число отчётов
    std::vector<std::string> include;

    /// Учитывается только при пустом include
    std::vector<std::string> exclude;

    /// На семейство (include задан) или всего (include пуст)
    std::size_t count = 100;

    SelectionOrder order = SelectionOrder::Random;

    std::filesystem::path output_dir = "extracted_reports";

    /// Маппинг меток вместо чтения отчётов; требует include
    std::optional<std::filesystem::path> mapping;

    /// Зерно для SelectionOrder::Random (иначе std::random_device)
    std::optional<std::uint32_t> seed;
};

// ----------------------------------------------------------------------------
// Результат
// ----------------------------------------------------------------------------

struct FamilySelection {
    std::string family;
    std::vector<std::filesystem::path> reports;
};

struct ExtractResult {
    /// Сначала семейства из include (в их порядке), затем в порядке появления
    std::vector<FamilySelection> selected;

    std::size_t copied = 0;
    std::size_t failed = 0;      // ошибка копирования
    std::size_t unreadable = 0;  // отчёт не распарсился

    std::size_t total_selected() const;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// "Reline, Disabler,Agenttesla" -> {"Reline", "Disabler", "Agenttesla"}
/// Пробелы по краям отбрасываются, пустые элементы пропускаются.
std::vector<std::string> split_families(std::string_view list);

/// Метка семейства отчёта (нормализованная capitalize_label)
/// @return nullopt если поле отсутствует или имеет неожиданный тип
std::optional<std::string> report_label(const Value& report, LabelSource source);

/// Выбрать отчёты, читая метку из каждого файла по порядку reports.
/// Чтение прекращается, как только все квоты заполнены.
std::vector<FamilySelection> select_reports(const std::vector<std::filesystem::path>& reports,
                                            const ExtractOptions& options,
                                            output::Writer& writer,
                                            std::size_t* unreadable = nullptr);

/// Выбрать отчёты по маппингу меток; имена отчётов берутся относительно json_dir
std::vector<FamilySelection> select_from_mapping(const Value& mapping,
                                                 const std::filesystem::path& json_dir,
                                                 const ExtractOptions& options,
                                                 std::mt19937& rng, output::Writer& writer);

/// Полная операция: выбор и копирование в options.output_dir
/// @throws std::runtime_error если директория недоступна, отчётов нет,
///         маппинг не читается или задан без include
ExtractResult run_extract(const std::filesystem::path& json_dir, const ExtractOptions& options,
                          output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_EXTRACT_HPP
