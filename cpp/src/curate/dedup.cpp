// ==============================================================================
// dedup.cpp - Фаза 2: разрешение дубликатов
// ==============================================================================

#include <curator/dedup.hpp>
#include <curator/output.hpp>
#include <curator/platform.hpp>
#include <curator/report.hpp>
#include <rapidjson/document.h>
#include <unordered_map>

namespace curator::curate {

// ============================================================================
// Группировка
// ============================================================================

std::vector<DuplicateGroup> group_duplicates(const std::vector<HashedReport>& reports) {
    std::vector<DuplicateGroup> groups;

    // hash -> индекс первого появления в reports
    std::unordered_map<std::string, std::size_t> first_seen;
    // hash -> индекс группы в groups
    std::unordered_map<std::string, std::size_t> group_index;

    for (std::size_t i = 0; i < reports.size(); ++i) {
        const HashedReport& report = reports[i];

        auto seen = first_seen.find(report.sha512);
        if (seen == first_seen.end()) {
            first_seen.emplace(report.sha512, i);
            continue;
        }

        auto existing = group_index.find(report.sha512);
        if (existing == group_index.end()) {
            const HashedReport& first = reports[seen->second];
            DuplicateGroup group;
            group.hash = report.sha512;
            group.members.push_back(GroupMember{first.path, first.size});
            group.members.push_back(GroupMember{report.path, report.size});
            group_index.emplace(report.sha512, groups.size());
            groups.push_back(std::move(group));
        } else {
            groups[existing->second].members.push_back(GroupMember{report.path, report.size});
        }
    }

    return groups;
}

GroupResolution resolve_group(const DuplicateGroup& group, config::KeepStrategy strategy) {
    GroupResolution resolution;
    if (group.members.empty()) {
        return resolution;
    }

    switch (strategy) {
        case config::KeepStrategy::First:
            resolution.kept = 0;
            for (std::size_t i = 1; i < group.members.size(); ++i) {
                resolution.discarded.push_back(i);
            }
            break;

        case config::KeepStrategy::Biggest: {
            std::size_t keeper = 0;
            for (std::size_t i = 1; i < group.members.size(); ++i) {
                if (group.members[i].size > group.members[keeper].size) {
                    resolution.discarded.push_back(keeper);
                    keeper = i;
                } else {
                    resolution.discarded.push_back(i);
                }
            }
            resolution.kept = keeper;
            break;
        }
    }

    return resolution;
}

// ============================================================================
// Чтение хэшей
// ============================================================================

std::vector<HashedReport> read_hashes(const std::vector<std::filesystem::path>& reports,
                                      output::Writer& writer) {
    std::vector<HashedReport> hashed;
    hashed.reserve(reports.size());

    writer.progress_begin("Detect duplicate reports", reports.size());
    for (const auto& path : reports) {
        auto loaded = io::load_report(path);
        writer.progress_advance();
        if (!loaded.ok) {
            writer.error(loaded.error.format());
            continue;
        }

        const Value* hash = lookup(loaded.report.data, {"target", "file", "sha512"});
        const std::string* hash_str = hash != nullptr ? hash->get_string() : nullptr;
        if (hash_str == nullptr) {
            writer.progress_end();
            throw PreconditionError("report '" + platform::path_to_utf8(path) +
                                    "' has no target.file.sha512, cannot resolve duplicates");
        }

        hashed.push_back(HashedReport{path, *hash_str, platform::file_size_or_zero(path)});
    }
    writer.progress_end();

    return hashed;
}

// ============================================================================
// Фаза
// ============================================================================

namespace {

/// {hash: [{path: size}, ...], ...}
rapidjson::Document groups_to_json(const std::vector<DuplicateGroup>& groups) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& alloc = doc.GetAllocator();

    for (const auto& group : groups) {
        rapidjson::Value members(rapidjson::kArrayType);
        for (const auto& member : group.members) {
            std::string path = platform::path_to_utf8(member.path);
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember(
                rapidjson::Value(path.c_str(), static_cast<rapidjson::SizeType>(path.size()),
                                 alloc),
                rapidjson::Value(member.size), alloc);
            members.PushBack(entry, alloc);
        }
        doc.AddMember(rapidjson::Value(group.hash.c_str(),
                                       static_cast<rapidjson::SizeType>(group.hash.size()),
                                       alloc),
                      members, alloc);
    }

    return doc;
}

}  // anonymous namespace

DedupResult run_dedup(const std::vector<std::filesystem::path>& reports,
                      config::KeepStrategy strategy, const StagingLayout& layout,
                      output::Writer& writer) {
    writer.rule("Phase 2: Detect duplicate reports", output::Color::Yellow);
    writer.info("Total reports: " + std::to_string(reports.size()));
    writer.info("Strategy for duplicates: " + config::keep_strategy_to_string(strategy));

    DedupResult result;
    result.groups = group_duplicates(read_hashes(reports, writer));

    writer.info("Writing reports with duplicates to " +
                platform::path_to_utf8(layout.duplicates_json()));
    io::write_json_file(layout.duplicates_json(), groups_to_json(result.groups));

    writer.info("Moving duplicate reports to " +
                platform::path_to_utf8(layout.duplicates_quarantine()));
    for (const auto& group : result.groups) {
        GroupResolution resolution = resolve_group(group, strategy);
        writer.debug("Duplicate group " + group.hash + ": keeping " +
                     platform::path_to_utf8(group.members[resolution.kept].path));
        for (std::size_t index : resolution.discarded) {
            result.discarded.push_back(group.members[index].path);
        }
    }
    result.move_failures =
        move_to_quarantine(result.discarded, layout.duplicates_quarantine(), writer);

    writer.rule("End of Phase 2", output::Color::Yellow);
    return result;
}

}  // namespace curator::curate
