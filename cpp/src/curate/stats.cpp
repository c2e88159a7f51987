// ==============================================================================
// stats.cpp - Фаза 4: статистика по итоговому набору отчётов
// ==============================================================================

#include <algorithm>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <curator/stats.hpp>
#include <rapidjson/document.h>
#include <stdexcept>

namespace curator::curate {

// ============================================================================
// LabelCounter
// ============================================================================

void LabelCounter::add(const std::string& label) {
    auto it = index_.find(label);
    if (it == index_.end()) {
        index_.emplace(label, entries_.size());
        entries_.emplace_back(label, 1);
    } else {
        ++entries_[it->second].second;
    }
}

std::size_t LabelCounter::count(const std::string& label) const {
    auto it = index_.find(label);
    return it == index_.end() ? 0 : entries_[it->second].second;
}

std::vector<std::pair<std::string, std::size_t>> LabelCounter::most_common() const {
    auto sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return sorted;
}

std::string capitalize_label(std::string_view label) {
    std::string out(label);
    if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
        out[0] = static_cast<char>(out[0] - 'a' + 'A');
    }
    return out;
}

// ============================================================================
// StatsAccumulator
// ============================================================================

std::optional<double> StatsAccumulator::average_spawned_processes() const {
    if (total_reports == 0) {
        return std::nullopt;
    }
    return static_cast<double>(total_spawned_processes) / static_cast<double>(total_reports);
}

std::optional<double> StatsAccumulator::average_hooked_functions() const {
    if (total_spawned_processes == 0) {
        return std::nullopt;
    }
    return static_cast<double>(total_hooked_functions) /
           static_cast<double>(total_spawned_processes);
}

std::optional<double> StatsAccumulator::average_vt_positives() const {
    if (total_reports == 0) {
        return std::nullopt;
    }
    return static_cast<double>(total_vt_positives) / static_cast<double>(total_reports);
}

// ============================================================================
// StatsAggregator
// ============================================================================

StatsAggregator::StatsAggregator(std::int64_t vt_threshold) {
    acc_.vt_threshold = vt_threshold;
}

void StatsAggregator::add_unreadable() {
    ++acc_.total_reports;
}

StatsAccumulator StatsAggregator::take() {
    StatsAccumulator out = std::move(acc_);
    acc_ = StatsAccumulator{};
    acc_.vt_threshold = out.vt_threshold;
    return out;
}

void StatsAggregator::add_report(const Value& report, const std::filesystem::path& path,
                                 output::Writer* writer) {
    ++acc_.total_reports;

    // Процессы и перехваченные функции
    const Value* processes = lookup(report, {"behavior", "processes"});
    const std::uint64_t spawned = processes != nullptr ? processes->array_size() : 0;
    acc_.total_spawned_processes += spawned;
    acc_.min_spawned_processes.update(spawned, path);
    acc_.max_spawned_processes.update(spawned, path);

    if (const auto* list = processes != nullptr ? processes->get_array() : nullptr) {
        for (const auto& process : *list) {
            const Value* calls = process.get("calls");
            const std::uint64_t hooked = calls != nullptr ? calls->array_size() : 0;
            acc_.total_hooked_functions += hooked;
            acc_.min_hooked_functions.update(hooked, path);
            acc_.max_hooked_functions.update(hooked, path);
        }
    }

    // VirusTotal
    const Value* positives_value = lookup(report, {"target", "file", "virustotal", "positives"});
    std::int64_t positives = 0;
    if (positives_value == nullptr || !positives_value->to_int64(positives)) {
        if (writer != nullptr) {
            writer->warn("Problems related to VirusTotal entry in report " +
                         platform::path_to_utf8(path) + ", skipping report");
        }
        return;
    }

    acc_.total_vt_positives += positives;
    acc_.min_vt_positives.update(positives, path);
    acc_.max_vt_positives.update(positives, path);
    if (positives <= acc_.vt_threshold) {
        acc_.undetected.push_back(path);
    }

    // Консенсус меток песочницы
    const Value* detections = report.get("detections");
    const std::string* detections_str = detections != nullptr ? detections->get_string() : nullptr;
    const bool no_consensus =
        detections == nullptr || (detections_str != nullptr && *detections_str == io::NA_SENTINEL);

    if (no_consensus && positives != 0) {
        acc_.no_cape_consensus.push_back(path);
        acc_.cape_labels.add(io::NA_SENTINEL);
    } else if (positives != 0) {
        if (const auto* list = detections != nullptr ? detections->get_array() : nullptr) {
            for (const auto& detection : *list) {
                const Value* family = detection.get("family");
                const std::string* family_str = family != nullptr ? family->get_string() : nullptr;
                if (family_str != nullptr) {
                    acc_.cape_labels.add(capitalize_label(*family_str));
                }
            }
        }
    }

    // Консенсус AVClass
    const Value* avclass = report.get("avclass_detection");
    const std::string* avclass_str = avclass != nullptr ? avclass->get_string() : nullptr;
    if (avclass_str == nullptr) {
        if (writer != nullptr) {
            writer->warn("No AVClass detection field found in report " +
                         platform::path_to_utf8(path));
        }
        return;
    }

    std::string label = capitalize_label(*avclass_str);
    if (label == io::NA_SENTINEL) {
        acc_.no_avclass_consensus.push_back(path);
    }
    acc_.avclass_labels.add(label);
}

// ============================================================================
// Артефакты
// ============================================================================

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value make_string(const std::string& s, Allocator& alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

rapidjson::Value make_average(const std::optional<double>& average) {
    if (!average.has_value()) {
        return rapidjson::Value(rapidjson::kNullType);
    }
    return rapidjson::Value(*average);
}

/// {"<count_key>": n, "Example report": path}
template <typename Tracker>
rapidjson::Value extremum_entry(const Tracker& tracker, const char* count_key,
                                Allocator& alloc) {
    rapidjson::Value entry(rapidjson::kObjectType);
    if (tracker.has_value()) {
        entry.AddMember(rapidjson::StringRef(count_key), rapidjson::Value(tracker.value()),
                        alloc);
        entry.AddMember("Example report",
                        make_string(platform::path_to_utf8(tracker.exemplar()), alloc), alloc);
    } else {
        entry.AddMember(rapidjson::StringRef(count_key), rapidjson::Value(rapidjson::kNullType),
                        alloc);
        entry.AddMember("Example report", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    return entry;
}

/// [[label, count], ...]
rapidjson::Value labels_entry(const LabelCounter& counter, Allocator& alloc) {
    rapidjson::Value list(rapidjson::kArrayType);
    for (const auto& [label, count] : counter.most_common()) {
        rapidjson::Value pair(rapidjson::kArrayType);
        pair.PushBack(make_string(label, alloc), alloc);
        pair.PushBack(rapidjson::Value(static_cast<std::uint64_t>(count)), alloc);
        list.PushBack(pair, alloc);
    }
    return list;
}

}  // anonymous namespace

rapidjson::Document summary_to_json(const StatsAccumulator& acc) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    doc.AddMember("Total reports", rapidjson::Value(static_cast<std::uint64_t>(acc.total_reports)),
                  alloc);

    rapidjson::Value process_stats(rapidjson::kObjectType);
    process_stats.AddMember("Average spawned processes",
                            make_average(acc.average_spawned_processes()), alloc);
    process_stats.AddMember("Min spawned processes",
                            extremum_entry(acc.min_spawned_processes, "n_processes", alloc), alloc);
    process_stats.AddMember("Max spawned processes",
                            extremum_entry(acc.max_spawned_processes, "n_processes", alloc), alloc);
    doc.AddMember("Process stats", process_stats, alloc);

    rapidjson::Value hooked_stats(rapidjson::kObjectType);
    hooked_stats.AddMember("Average Hooked functions per process",
                           make_average(acc.average_hooked_functions()), alloc);
    hooked_stats.AddMember("Min Hooked functions",
                           extremum_entry(acc.min_hooked_functions, "n_hooked_functions", alloc),
                           alloc);
    hooked_stats.AddMember("Max Hooked functions",
                           extremum_entry(acc.max_hooked_functions, "n_hooked_functions", alloc),
                           alloc);
    doc.AddMember("Hooked functions stats", hooked_stats, alloc);

    rapidjson::Value detection_stats(rapidjson::kObjectType);
    detection_stats.AddMember("Average VT detections", make_average(acc.average_vt_positives()),
                              alloc);
    detection_stats.AddMember("Min VT detections",
                              extremum_entry(acc.min_vt_positives, "n_detections", alloc), alloc);
    detection_stats.AddMember("Max VT detections",
                              extremum_entry(acc.max_vt_positives, "n_detections", alloc), alloc);
    detection_stats.AddMember("CAPE Detections", labels_entry(acc.cape_labels, alloc), alloc);
    detection_stats.AddMember("AVClass Detections", labels_entry(acc.avclass_labels, alloc),
                              alloc);
    doc.AddMember("Detection stats", detection_stats, alloc);

    return doc;
}

std::string undetected_key(std::int64_t vt_threshold) {
    return "Undetected or benign (" + std::to_string(vt_threshold) +
           "/N or less VT detections)";
}

void write_stats_results(const StatsAccumulator& acc, const StagingLayout& layout,
                         output::Writer& writer) {
    writer.info("Writing report statistics to " +
                platform::path_to_utf8(layout.statistics_json()));
    io::write_json_file(layout.statistics_json(), summary_to_json(acc));

    rapidjson::Document undetected(rapidjson::kObjectType);
    auto& u_alloc = undetected.GetAllocator();
    undetected.AddMember(make_string(undetected_key(acc.vt_threshold), u_alloc),
                         paths_to_json(acc.undetected, u_alloc), u_alloc);
    writer.info("Writing benign or undetected reports to " +
                platform::path_to_utf8(layout.undetected_json()));
    io::write_json_file(layout.undetected_json(), undetected);

    rapidjson::Document unlabeled(rapidjson::kObjectType);
    auto& l_alloc = unlabeled.GetAllocator();
    unlabeled.AddMember("Reports with no CAPE detection consensus (n/a)",
                        paths_to_json(acc.no_cape_consensus, l_alloc), l_alloc);
    unlabeled.AddMember("Reports with no AVClass detection consensus (n/a)",
                        paths_to_json(acc.no_avclass_consensus, l_alloc), l_alloc);
    writer.info("Writing unlabeled reports to " + platform::path_to_utf8(layout.unlabeled_json()));
    io::write_json_file(layout.unlabeled_json(), unlabeled);
}

StatsAccumulator run_stats(const std::vector<std::filesystem::path>& reports,
                           std::int64_t vt_threshold, const StagingLayout& layout,
                           output::Writer& writer) {
    writer.rule("Phase 4: Report stats generation", output::Color::Magenta);
    writer.info("Total reports: " + std::to_string(reports.size()));

    StatsAggregator aggregator(vt_threshold);

    writer.progress_begin("Report stats generation", reports.size());
    for (const auto& path : reports) {
        auto loaded = io::load_report(path);
        if (loaded.ok) {
            aggregator.add_report(loaded.report.data, path, &writer);
        } else {
            writer.error(loaded.error.format());
            aggregator.add_unreadable();
        }
        writer.progress_advance();
    }
    writer.progress_end();

    StatsAccumulator acc = aggregator.take();
    write_stats_results(acc, layout, writer);

    writer.rule("End of Phase 4", output::Color::Magenta);
    return acc;
}

}  // namespace curator::curate
