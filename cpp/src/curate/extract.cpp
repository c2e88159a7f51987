// ==============================================================================
// extract.cpp - Выборка отчётов по меткам семейств
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <curator/discovery.hpp>
#include <curator/extract.hpp>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <curator/stats.hpp>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

namespace curator::curate {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.remove_suffix(1);
    }
    return s;
}

// Имя из маппинга должно быть простым именем файла внутри json_dir
bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

// Учёт квот при последовательном выборе
class Quota {
public:
    explicit Quota(const ExtractOptions& options) : count_(options.count) {
        for (const auto& family : options.include) {
            std::string label = capitalize_label(family);
            if (index_.count(label) == 0) {
                index_.emplace(label, selected_.size());
                selected_.push_back(FamilySelection{std::move(label), {}});
            }
        }
        per_family_ = !selected_.empty();
        for (const auto& family : options.exclude) {
            excluded_.push_back(capitalize_label(family));
        }
    }

    bool full() const {
        const std::size_t limit = per_family_ ? count_ * selected_.size() : count_;
        return taken_ >= limit;
    }

    void offer(const std::string& label, const std::filesystem::path& report) {
        auto it = index_.find(label);
        if (per_family_) {
            if (it == index_.end() || selected_[it->second].reports.size() >= count_) {
                return;
            }
        } else {
            if (taken_ >= count_ ||
                std::find(excluded_.begin(), excluded_.end(), label) != excluded_.end()) {
                return;
            }
            if (it == index_.end()) {
                it = index_.emplace(label, selected_.size()).first;
                selected_.push_back(FamilySelection{label, {}});
            }
        }
        selected_[it->second].reports.push_back(report);
        ++taken_;
    }

    std::vector<FamilySelection> release() { return std::move(selected_); }

private:
    std::size_t count_;
    bool per_family_ = false;
    std::size_t taken_ = 0;
    std::vector<FamilySelection> selected_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::string> excluded_;
};

}  // namespace

// ============================================================================
// Разбор опций
// ============================================================================

std::optional<LabelSource> parse_label_source(std::string_view s) {
    const std::string v = lower(s);
    if (v == "a" || v == "avclass") {
        return LabelSource::AVClass;
    }
    if (v == "c" || v == "cape") {
        return LabelSource::Cape;
    }
    return std::nullopt;
}

std::optional<SelectionOrder> parse_selection_order(std::string_view s) {
    const std::string v = lower(s);
    if (v == "r" || v == "random") {
        return SelectionOrder::Random;
    }
    if (v == "f" || v == "first") {
        return SelectionOrder::FirstFound;
    }
    return std::nullopt;
}

std::size_t ExtractResult::total_selected() const {
    std::size_t total = 0;
    for (const auto& family : selected) {
        total += family.reports.size();
    }
    return total;
}

std::vector<std::string> split_families(std::string_view list) {
    std::vector<std::string> out;
    while (true) {
        const auto comma = list.find(',');
        std::string_view item = trim(list.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return out;
}

std::optional<std::string> report_label(const Value& report, LabelSource source) {
    if (source == LabelSource::AVClass) {
        const Value* avclass = report.get("avclass_detection");
        const std::string* label = avclass != nullptr ? avclass->get_string() : nullptr;
        if (label == nullptr) {
            return std::nullopt;
        }
        return capitalize_label(*label);
    }

    const Value* detections = report.get("detections");
    if (detections == nullptr) {
        return std::nullopt;
    }
    // "(n/a)" и прочие строковые значения - сами по себе метка
    if (const std::string* label = detections->get_string()) {
        return *label;
    }
    const Value* first = detections->at(0);
    const Value* family = first != nullptr ? first->get("family") : nullptr;
    const std::string* family_str = family != nullptr ? family->get_string() : nullptr;
    if (family_str == nullptr) {
        return std::nullopt;
    }
    return capitalize_label(*family_str);
}

// ============================================================================
// Выбор по содержимому отчётов
// ============================================================================

std::vector<FamilySelection> select_reports(const std::vector<std::filesystem::path>& reports,
                                            const ExtractOptions& options,
                                            output::Writer& writer, std::size_t* unreadable) {
    Quota quota(options);

    writer.progress_begin("Extract reports", reports.size());
    for (const auto& path : reports) {
        if (quota.full()) {
            break;
        }
        writer.progress_advance();

        auto loaded = io::load_report(path);
        if (!loaded.ok) {
            writer.warn(loaded.error.format());
            if (unreadable != nullptr) {
                ++*unreadable;
            }
            continue;
        }

        auto label = report_label(loaded.report.data, options.label);
        if (label) {
            quota.offer(*label, path);
        }
    }
    writer.progress_end();

    return quota.release();
}

// ============================================================================
// Выбор по маппингу меток
// ============================================================================

std::vector<FamilySelection> select_from_mapping(const Value& mapping,
                                                 const std::filesystem::path& json_dir,
                                                 const ExtractOptions& options,
                                                 std::mt19937& rng, output::Writer& writer) {
    std::vector<FamilySelection> selected;

    for (const auto& family : options.include) {
        const Value* entry = mapping.get(family);
        if (entry == nullptr) {
            entry = mapping.get(capitalize_label(family));
        }
        if (entry == nullptr || !entry->is_object()) {
            writer.warn("Family " + family + " not present in mapping file, skipping");
            continue;
        }

        std::vector<std::string> names;
        const Value* list = entry->get("reports");
        if (const auto* items = list != nullptr ? list->get_array() : nullptr) {
            for (const auto& item : *items) {
                const Value* name = item.is_object() ? item.get("report") : &item;
                const std::string* name_str = name != nullptr ? name->get_string() : nullptr;
                if (name_str == nullptr) {
                    continue;
                }
                if (!is_plain_file_name(*name_str)) {
                    writer.warn("Invalid report name in mapping for " + family + ": '" +
                                *name_str + "'");
                    continue;
                }
                names.push_back(*name_str);
            }
        }

        if (options.order == SelectionOrder::Random) {
            std::shuffle(names.begin(), names.end(), rng);
        }
        if (names.size() < options.count) {
            writer.warn("There are only " + std::to_string(names.size()) + " reports for " +
                        family);
        }

        FamilySelection selection{capitalize_label(family), {}};
        const std::size_t take = std::min(names.size(), options.count);
        for (std::size_t i = 0; i < take; ++i) {
            selection.reports.push_back(json_dir / platform::path_from_utf8(names[i]));
        }
        selected.push_back(std::move(selection));
    }

    return selected;
}

// ============================================================================
// run_extract
// ============================================================================

ExtractResult run_extract(const std::filesystem::path& json_dir, const ExtractOptions& options,
                          output::Writer& writer) {
    ExtractResult result;
    std::mt19937 rng(options.seed ? *options.seed : std::random_device{}());

    writer.rule("Extract reports");

    if (options.mapping) {
        if (options.include.empty()) {
            throw std::runtime_error("--mapping requires at least one family in --include");
        }
        std::error_code ec;
        if (!std::filesystem::is_directory(json_dir, ec)) {
            throw std::runtime_error("Directory not found: " + platform::path_to_utf8(json_dir));
        }
        auto loaded = io::load_report(*options.mapping);
        if (!loaded.ok) {
            throw std::runtime_error(loaded.error.format());
        }
        if (!loaded.report.data.is_object()) {
            throw std::runtime_error("mapping file " + platform::path_to_utf8(*options.mapping) +
                                     " is not a JSON object");
        }
        result.selected =
            select_from_mapping(loaded.report.data, json_dir, options, rng, writer);
    } else {
        auto reports = io::discover_reports(json_dir, io::DiscoveryOptions{}, &writer);
        if (reports.empty()) {
            throw std::runtime_error("No reports found in " + platform::path_to_utf8(json_dir));
        }
        if (options.order == SelectionOrder::Random) {
            std::shuffle(reports.begin(), reports.end(), rng);
        }
        result.selected = select_reports(reports, options, writer, &result.unreadable);
    }

    const auto& out_dir = options.output_dir;
    const std::string out_name = platform::path_to_utf8(out_dir);
    std::error_code ec;
    if (std::filesystem::exists(out_dir, ec)) {
        writer.warn("Output directory " + out_name +
                    " already exists, files with the same name will be overwritten");
    } else {
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            throw std::runtime_error("failed to create directory '" + out_name + "' - " +
                                     ec.message());
        }
    }

    for (const auto& family : result.selected) {
        for (const auto& report : family.reports) {
            std::error_code copy_ec;
            std::filesystem::copy_file(report, out_dir / report.filename(),
                                       std::filesystem::copy_options::overwrite_existing,
                                       copy_ec);
            if (copy_ec) {
                writer.error("Failed to copy " + platform::path_to_utf8(report) + ": " +
                             copy_ec.message());
                ++result.failed;
            } else {
                ++result.copied;
            }
        }
    }

    writer.info("Extracted " + std::to_string(result.copied) + " reports to " + out_name);
    return result;
}

}  // namespace curator::curate
