// ==============================================================================
// classifier.cpp - Фаза 1: поиск некорректных отчётов
// ==============================================================================

#include <curator/classifier.hpp>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <rapidjson/document.h>
#include <unordered_set>

namespace curator::curate {

// ============================================================================
// Классификация одного отчёта
// ============================================================================

Classification classify(const Value& report) {
    Classification c;

    if (!report.has("target")) {
        c.structural = ErrorCategory::Fatal;
        return c;
    }

    const Value* processes = lookup(report, {"behavior", "processes"});
    if (processes == nullptr || processes->array_size() == 0) {
        c.structural = ErrorCategory::NoProcesses;
        return c;
    }

    const Value* first = processes->at(0);
    const Value* calls = first != nullptr ? first->get("calls") : nullptr;
    if (calls == nullptr || calls->array_size() == 0) {
        c.structural = ErrorCategory::NoHookedFunctions;
        return c;
    }

    const Value* vt = lookup(report, {"target", "file", "virustotal"});
    c.no_vt = vt == nullptr;
    c.vt_error = vt != nullptr && vt->has("error");
    return c;
}

// ============================================================================
// ClassifierResult
// ============================================================================

std::vector<std::filesystem::path> ClassifierResult::structural() const {
    std::vector<std::filesystem::path> out;
    out.reserve(fatal.size() + no_processes.size() + no_hooked_functions.size());
    out.insert(out.end(), fatal.begin(), fatal.end());
    out.insert(out.end(), no_processes.begin(), no_processes.end());
    out.insert(out.end(), no_hooked_functions.begin(), no_hooked_functions.end());
    return out;
}

std::vector<std::filesystem::path> ClassifierResult::vt_broken() const {
    std::vector<std::filesystem::path> out;
    std::unordered_set<std::string> seen;
    for (const auto* list : {&no_vt, &vt_error}) {
        for (const auto& p : *list) {
            if (seen.insert(p.string()).second) {
                out.push_back(p);
            }
        }
    }
    return out;
}

// ============================================================================
// Фаза
// ============================================================================

namespace {

using Allocator = rapidjson::Document::AllocatorType;

/// {"Reports": [...], "n": N}
rapidjson::Value category_entry(const std::vector<std::filesystem::path>& reports,
                                Allocator& alloc) {
    rapidjson::Value entry(rapidjson::kObjectType);
    entry.AddMember("Reports", paths_to_json(reports, alloc), alloc);
    entry.AddMember("n", rapidjson::Value(static_cast<std::uint64_t>(reports.size())), alloc);
    return entry;
}

}  // anonymous namespace

ClassifierResult scan_reports(const std::vector<std::filesystem::path>& reports,
                              output::Writer& writer) {
    ClassifierResult result;

    writer.progress_begin("Detect incorrect reports", reports.size());
    for (const auto& path : reports) {
        auto loaded = io::load_report(path);
        if (!loaded.ok) {
            // Нераспарсенный отчёт эквивалентен отчёту без "target"
            writer.warn(loaded.error.format());
            result.fatal.push_back(path);
            writer.progress_advance();
            continue;
        }

        Classification c = classify(loaded.report.data);
        if (c.structural.has_value()) {
            switch (*c.structural) {
                case ErrorCategory::Fatal:
                    result.fatal.push_back(path);
                    break;
                case ErrorCategory::NoProcesses:
                    result.no_processes.push_back(path);
                    break;
                case ErrorCategory::NoHookedFunctions:
                    result.no_hooked_functions.push_back(path);
                    break;
            }
        } else {
            if (c.no_vt) {
                result.no_vt.push_back(path);
            }
            if (c.vt_error) {
                result.vt_error.push_back(path);
            }
        }
        writer.progress_advance();
    }
    writer.progress_end();

    return result;
}

std::vector<std::filesystem::path> quarantine_reports(const ClassifierResult& result,
                                                      const StagingLayout& layout,
                                                      output::Writer& writer) {
    rapidjson::Document errors(rapidjson::kObjectType);
    auto& alloc = errors.GetAllocator();
    errors.AddMember("Fatal reports", category_entry(result.fatal, alloc), alloc);
    errors.AddMember("Reports with no processes", category_entry(result.no_processes, alloc),
                     alloc);
    errors.AddMember("Reports with no hooked functions",
                     category_entry(result.no_hooked_functions, alloc), alloc);

    writer.info("Writing reports with errors to " + platform::path_to_utf8(layout.errors_json()));
    io::write_json_file(layout.errors_json(), errors);

    writer.info("Moving reports with errors to " +
                platform::path_to_utf8(layout.errors_quarantine()));
    std::vector<std::filesystem::path> failed =
        move_to_quarantine(result.structural(), layout.errors_quarantine(), writer);

    rapidjson::Document vt_errors(rapidjson::kObjectType);
    auto& vt_alloc = vt_errors.GetAllocator();
    vt_errors.AddMember("Reports with no VT entry", category_entry(result.no_vt, vt_alloc),
                        vt_alloc);
    vt_errors.AddMember("Reports with VT error", category_entry(result.vt_error, vt_alloc),
                        vt_alloc);

    writer.info("Writing reports with VT errors to " +
                platform::path_to_utf8(layout.vt_errors_json()));
    io::write_json_file(layout.vt_errors_json(), vt_errors);

    writer.info("Moving reports with VT errors to " +
                platform::path_to_utf8(layout.vt_errors_quarantine()));
    auto vt_failed = move_to_quarantine(result.vt_broken(), layout.vt_errors_quarantine(), writer);
    failed.insert(failed.end(), vt_failed.begin(), vt_failed.end());
    return failed;
}

ClassifierResult run_classifier(const std::vector<std::filesystem::path>& reports,
                                const StagingLayout& layout, output::Writer& writer) {
    writer.rule("Phase 1: Detect incorrect reports", output::Color::Magenta);
    writer.info("Total reports: " + std::to_string(reports.size()));

    ClassifierResult result = scan_reports(reports, writer);
    result.move_failures = quarantine_reports(result, layout, writer);

    writer.rule("End of Phase 1", output::Color::Magenta);
    return result;
}

}  // namespace curator::curate
