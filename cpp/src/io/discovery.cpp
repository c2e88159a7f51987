// ==============================================================================
// discovery.cpp - Поиск JSON-отчётов во входной директории
// ==============================================================================

#include "curator/discovery.hpp"

#include "curator/output.hpp"
#include "curator/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace curator::io {

namespace {

/// Проверяет расширение файла (без точки, case-sensitive)
bool matches_extension(const std::filesystem::path& file_path, const std::string& extension) {
    if (!file_path.has_extension()) {
        return false;
    }
    std::string ext = file_path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return ext == extension;
}

/// Сообщить об ошибке: исключение или предупреждение (skip_errors)
void report_problem(const std::string& message, bool skip_errors, output::Writer* writer) {
    if (!skip_errors) {
        throw std::runtime_error(message);
    }
    if (writer != nullptr) {
        writer->warn(message);
    }
}

void collect_reports(const std::filesystem::path& dir, const DiscoveryOptions& opt,
                     output::Writer* writer, std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(dir, ec);
    if (ec) {
        report_problem("failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                           ec.message(),
                       opt.skip_errors, writer);
        return;
    }

    for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            report_problem("failed to iterate directory '" + platform::path_to_utf8(dir) +
                               "' - " + ec.message(),
                           opt.skip_errors, writer);
            return;
        }

        const auto& entry = *it;
        std::error_code status_ec;
        auto status = entry.status(status_ec);
        if (status_ec) {
            report_problem("failed to get metadata for file - " + status_ec.message(),
                           opt.skip_errors, writer);
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            if (opt.recursive) {
                collect_reports(entry.path(), opt, writer, result);
            }
        } else if (std::filesystem::is_regular_file(status)) {
            if (matches_extension(entry.path(), opt.extension)) {
                result.push_back(entry.path());
            }
        }
        // Symlinks на несуществующие цели, сокеты и т.п. игнорируются
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> discover_reports(const std::filesystem::path& dir,
                                                    const DiscoveryOptions& opt,
                                                    output::Writer* writer) {
    std::vector<std::filesystem::path> result;

    std::error_code ec;
    bool exists = std::filesystem::exists(dir, ec);
    if (ec || !exists) {
        report_problem("Specified report directory does not exist - " +
                           platform::path_to_utf8(dir),
                       opt.skip_errors, writer);
        return result;
    }

    if (!std::filesystem::is_directory(dir, ec) || ec) {
        report_problem("Specified report path is not a directory - " +
                           platform::path_to_utf8(dir),
                       opt.skip_errors, writer);
        return result;
    }

    collect_reports(dir, opt, writer, result);

    // Порядок directory_iterator зависит от ОС; сортируем для воспроизводимости
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace curator::io
