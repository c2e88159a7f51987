// ==============================================================================
// curator/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Файловые операции пайплайна: чтение, атомарная запись, перемещение
//
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef CURATOR_PLATFORM_HPP
#define CURATOR_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace curator::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка (используется во всех выходных JSON)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файловые операции
// ----------------------------------------------------------------------------

/// Прочитать файл целиком
/// @return nullopt если файл не удалось открыть или прочитать
std::optional<std::string> read_file(const std::filesystem::path& path);

/// Атомарно заменить содержимое файла: запись в "<path>.tmp", затем rename
/// @throws std::runtime_error при ошибке записи или переименования
void write_file_atomic(const std::filesystem::path& path, std::string_view content);

/// Переместить файл в директорию (создаётся при необходимости), сохранив имя.
/// Между файловыми системами выполняет copy + remove.
/// @return новый путь файла
/// @throws std::runtime_error при ошибке
std::filesystem::path move_into(const std::filesystem::path& file,
                                const std::filesystem::path& dir);

/// Размер файла в байтах (0 при ошибке)
std::uint64_t file_size_or_zero(const std::filesystem::path& path);

}  // namespace curator::platform

#endif  // CURATOR_PLATFORM_HPP
