// ==============================================================================
// staging.cpp - Раскладка выходных директорий пайплайна
// ==============================================================================

#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/staging.hpp>
#include <stdexcept>
#include <string>
#include <system_error>

namespace curator::curate {

StagingLayout::StagingLayout(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path StagingLayout::errors_dir() const {
    return root_ / "reports_with_errors";
}

std::filesystem::path StagingLayout::errors_json() const {
    return errors_dir() / "reports_with_errors.json";
}

std::filesystem::path StagingLayout::vt_errors_json() const {
    return errors_dir() / "reports_with_vt_errors.json";
}

std::filesystem::path StagingLayout::errors_quarantine() const {
    return errors_dir() / "reports_with_errors";
}

std::filesystem::path StagingLayout::vt_errors_quarantine() const {
    return errors_dir() / "reports_with_vt_errors";
}

std::filesystem::path StagingLayout::duplicates_dir() const {
    return root_ / "duplicate_reports";
}

std::filesystem::path StagingLayout::duplicates_json() const {
    return duplicates_dir() / "duplicate_reports.json";
}

std::filesystem::path StagingLayout::duplicates_quarantine() const {
    return duplicates_dir() / "duplicate_reports";
}

std::filesystem::path StagingLayout::results_dir() const {
    return root_ / "results";
}

std::filesystem::path StagingLayout::statistics_json() const {
    return results_dir() / "reports_statistics.json";
}

std::filesystem::path StagingLayout::undetected_json() const {
    return results_dir() / "undetected_or_benign_reports.json";
}

std::filesystem::path StagingLayout::unlabeled_json() const {
    return results_dir() / "unlabeled_reports.json";
}

rapidjson::Value paths_to_json(const std::vector<std::filesystem::path>& paths,
                               rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value list(rapidjson::kArrayType);
    list.Reserve(static_cast<rapidjson::SizeType>(paths.size()), alloc);
    for (const auto& p : paths) {
        const std::string s = platform::path_to_utf8(p);
        list.PushBack(rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc),
                      alloc);
    }
    return list;
}

std::vector<std::filesystem::path> move_to_quarantine(
    const std::vector<std::filesystem::path>& reports, const std::filesystem::path& quarantine,
    output::Writer& writer) {
    std::error_code ec;
    std::filesystem::create_directories(quarantine, ec);
    if (!ec && !std::filesystem::is_directory(quarantine, ec)) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (ec) {
        writer.error("failed to create directory '" + platform::path_to_utf8(quarantine) +
                     "' - " + ec.message());
        return reports;
    }

    std::vector<std::filesystem::path> failed;
    for (const auto& report : reports) {
        try {
            platform::move_into(report, quarantine);
        } catch (const std::runtime_error& e) {
            writer.error(e.what());
            failed.push_back(report);
        }
    }
    return failed;
}

}  // namespace curator::curate
