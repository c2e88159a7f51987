// ==============================================================================
// curator/rename.hpp - Переименование отчётов по sha256
// ==============================================================================

#ifndef CURATOR_RENAME_HPP
#define CURATOR_RENAME_HPP

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace curator::output {
class Writer;
}

namespace curator::curate {

struct RenameCounts {
    std::size_t renamed = 0;
    std::size_t skipped = 0;       // <sha256>.json уже существует
    std::size_t missing_hash = 0;  // нет target.file.sha256 или это не 64 hex-символа
    std::size_t failed = 0;        // не парсится или ошибка rename
};

/// 64 шестнадцатеричных символа
bool is_sha256_digest(std::string_view s);

/// Переименовать каждый *.json в директории в <sha256>.json
/// @throws std::runtime_error если директория не существует
RenameCounts rename_reports(const std::filesystem::path& dir, output::Writer& writer);

}  // namespace curator::curate

#endif  // CURATOR_RENAME_HPP
