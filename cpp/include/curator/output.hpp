// ==============================================================================
// curator/output.hpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (другие модули не пишут в потоки)
// - Уровни сообщений: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Разделители фаз пайплайна и прогресс-индикатор
// - Итоговые таблицы (Unicode box-drawing)
//
// Writer потокобезопасен: фаза санитизации пишет в него из рабочих потоков.
//
// ==============================================================================

#ifndef CURATOR_OUTPUT_HPP
#define CURATOR_OUTPUT_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace curator::output {

enum class Stream { Stdout, Stderr };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

// ----------------------------------------------------------------------------
// Уровни сообщений
// ----------------------------------------------------------------------------

enum class Level {
    Info,   // [+] скрыт при quiet
    Warn,   // [!] скрыт при quiet
    Error,  // [x] всегда
    Debug,  // [*] при verbose >= 1
    Trace   // [~] при verbose >= 2
};

/// "[+] ", "[!] ", ...
std::string_view level_prefix(Level level);

struct OutputConfig {
    bool quiet = false;      // -q/-s
    int verbose = 0;         // -v (повторяемый)
    bool no_banner = false;  // --no-banner
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Сообщение уровня level в stderr, если уровень не подавлен конфигурацией
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    /// Включён ли уровень при текущей конфигурации
    bool enabled(Level level) const;

    /// "──── <title> ────" в stderr (скрыт при quiet)
    void rule(std::string_view title, Color color = Color::Green);

    // Прогресс: одна строка в stderr, перерисовывается через '\r'.
    // Не рисуется при quiet, verbose и когда stderr не терминал.
    void progress_begin(std::string_view label, std::size_t total);
    void progress_advance();
    void progress_end();

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    // *_locked: вызывающий держит mutex_
    void emit_locked(Stream s, std::string_view bytes);
    void emit_colored_locked(Color color, std::string_view text);
    void clear_progress_locked();
    void render_progress_locked();

    OutputConfig config_;
    bool color_stderr_ = false;
    std::mutex mutex_;

    struct Progress {
        bool active = false;
        std::string label;
        std::size_t total = 0;
        std::size_t done = 0;
    } progress_;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(std::vector<std::string> headers);
    void add_row(std::vector<std::string> cells);

    /// В stdout через Writer (не подавляется quiet)
    void print(Writer& w) const;

    std::string to_string() const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

/// Длина строки в кодовых точках UTF-8 (для выравнивания)
std::size_t display_width(std::string_view s);

}  // namespace curator::output

#endif  // CURATOR_OUTPUT_HPP
