// ==============================================================================
// output.cpp - Пользовательский вывод и журналирование
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr, всегда через fwrite.
//
// ==============================================================================

#include "curator/output.hpp"

#include "curator/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace curator::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ERASE_LINE = "\r\x1b[2K";

constexpr std::size_t RULE_WIDTH = 72;
constexpr std::size_t PROGRESS_BAR_WIDTH = 30;

// Unicode box-drawing (UTF-8)
constexpr const char* H_LINE = "\xe2\x94\x80";    // ─
constexpr const char* V_LINE = "\xe2\x94\x82";    // │
constexpr const char* BAR_FULL = "\xe2\x94\x81";  // ━

/// Символы одной горизонтальной границы таблицы: левый, стык, правый
struct Border {
    const char* left;
    const char* join;
    const char* right;
};

constexpr Border TOP{"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};     // ┌ ┬ ┐
constexpr Border MIDDLE{"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├ ┼ ┤
constexpr Border BOTTOM{"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └ ┴ ┘

const char* color_code(Color color) {
    switch (color) {
        case Color::Green:
            return "\x1b[32m";
        case Color::Yellow:
            return "\x1b[33m";
        case Color::Red:
            return "\x1b[31m";
        case Color::Cyan:
            return "\x1b[36m";
        case Color::Magenta:
            return "\x1b[35m";
        case Color::Default:
            break;
    }
    return "";
}

Color level_color(Level level) {
    switch (level) {
        case Level::Info:
            return Color::Green;
        case Level::Warn:
            return Color::Yellow;
        case Level::Error:
            return Color::Red;
        case Level::Debug:
            return Color::Cyan;
        case Level::Trace:
            return Color::Magenta;
    }
    return Color::Default;
}

std::string repeat(const char* piece, std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        out += piece;
    }
    return out;
}

}  // namespace

std::string_view level_prefix(Level level) {
    switch (level) {
        case Level::Info:
            return "[+] ";
        case Level::Warn:
            return "[!] ";
        case Level::Error:
            return "[x] ";
        case Level::Debug:
            return "[*] ";
        case Level::Trace:
            return "[~] ";
    }
    return "";
}

// ============================================================================
// Writer
// ============================================================================

Writer::Writer(const OutputConfig& cfg)
    : config_(cfg), color_stderr_(platform::is_tty_stderr()) {}

Writer::~Writer() {
    progress_end();
    flush();
}

void Writer::emit_locked(Stream s, std::string_view bytes) {
    if (bytes.empty()) {
        return;
    }
    std::FILE* f = s == Stream::Stdout ? stdout : stderr;
    std::fwrite(bytes.data(), 1, bytes.size(), f);
}

void Writer::emit_colored_locked(Color color, std::string_view text) {
    if (color_stderr_ && color != Color::Default) {
        emit_locked(Stream::Stderr, color_code(color));
        emit_locked(Stream::Stderr, text);
        emit_locked(Stream::Stderr, ANSI_RESET);
    } else {
        emit_locked(Stream::Stderr, text);
    }
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_progress_locked();
    emit_locked(s, bytes);
    render_progress_locked();
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_progress_locked();
    emit_locked(s, bytes);
    emit_locked(s, "\n");
    render_progress_locked();
}

bool Writer::enabled(Level level) const {
    switch (level) {
        case Level::Info:
        case Level::Warn:
            return !config_.quiet;
        case Level::Error:
            return true;
        case Level::Debug:
            return config_.verbose >= 1;
        case Level::Trace:
            return config_.verbose >= 2;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    clear_progress_locked();
    emit_colored_locked(level_color(level), level_prefix(level));
    emit_locked(Stream::Stderr, message);
    emit_locked(Stream::Stderr, "\n");
    render_progress_locked();
}

void Writer::rule(std::string_view title, Color color) {
    if (config_.quiet) {
        return;
    }

    const std::size_t title_width = title.empty() ? 0 : display_width(title) + 2;
    const std::size_t fill = RULE_WIDTH > title_width ? RULE_WIDTH - title_width : 0;

    std::string line = repeat(H_LINE, fill / 2);
    if (!title.empty()) {
        line += ' ';
        line.append(title);
        line += ' ';
    }
    line += repeat(H_LINE, fill - fill / 2);

    std::lock_guard<std::mutex> lock(mutex_);
    clear_progress_locked();
    emit_colored_locked(color, line);
    emit_locked(Stream::Stderr, "\n");
    render_progress_locked();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin(std::string_view label, std::size_t total) {
    if (config_.quiet || config_.verbose > 0 || !color_stderr_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = Progress{true, std::string(label), total, 0};
    render_progress_locked();
}

void Writer::progress_advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_.active) {
        return;
    }
    progress_.done = std::min(progress_.done + 1, progress_.total);
    render_progress_locked();
}

void Writer::progress_end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_.active) {
        return;
    }
    clear_progress_locked();
    progress_ = Progress{};
}

void Writer::clear_progress_locked() {
    if (progress_.active) {
        emit_locked(Stream::Stderr, ERASE_LINE);
    }
}

void Writer::render_progress_locked() {
    if (!progress_.active) {
        return;
    }

    const std::size_t total = progress_.total;
    const std::size_t filled =
        total == 0 ? PROGRESS_BAR_WIDTH : progress_.done * PROGRESS_BAR_WIDTH / total;
    const std::size_t percent = total == 0 ? 100 : progress_.done * 100 / total;

    std::string line = ERASE_LINE + progress_.label + " " + repeat(BAR_FULL, filled) +
                       std::string(PROGRESS_BAR_WIDTH - filled, ' ') + " " +
                       std::to_string(progress_.done) + "/" + std::to_string(total) + " (" +
                       std::to_string(percent) + "%)";
    emit_locked(Stream::Stderr, line);
    std::fflush(stderr);
}

// ============================================================================
// Table
// ============================================================================

void Table::set_headers(std::vector<std::string> headers) {
    headers_ = std::move(headers);
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::string Table::to_string() const {
    std::size_t columns = headers_.size();
    for (const auto& row : rows_) {
        columns = std::max(columns, row.size());
    }

    std::vector<std::size_t> widths(columns, 0);
    auto measure = [&widths](const std::vector<std::string>& cells) {
        for (std::size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    measure(headers_);
    for (const auto& row : rows_) {
        measure(row);
    }

    auto border = [&widths](const Border& b) {
        std::string line = b.left;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            line += repeat(H_LINE, widths[i] + 2);
            line += i + 1 < widths.size() ? b.join : b.right;
        }
        return line + "\n";
    };

    auto row_line = [&widths](const std::vector<std::string>& cells) {
        std::string line = V_LINE;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            const std::string cell = i < cells.size() ? cells[i] : std::string();
            line += ' ' + cell + std::string(widths[i] - display_width(cell) + 1, ' ');
            line += V_LINE;
        }
        return line + "\n";
    };

    std::string out = border(TOP);
    if (!headers_.empty()) {
        out += row_line(headers_);
        out += border(MIDDLE);
    }
    for (const auto& row : rows_) {
        out += row_line(row);
    }
    out += border(BOTTOM);
    return out;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

std::size_t display_width(std::string_view s) {
    // Continuation bytes 10xxxxxx не считаются
    return static_cast<std::size_t>(std::count_if(
        s.begin(), s.end(), [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

}  // namespace curator::output
